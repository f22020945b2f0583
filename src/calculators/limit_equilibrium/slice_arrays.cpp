// src/calculators/limit_equilibrium/slice_arrays.cpp
#include "slice_arrays.h"
#include "../stability_core/stability_errors.h"
#include <cmath>
#include <sstream>

SliceArrays::SliceArrays(const std::vector<Slice>& slices) {
    const Eigen::Index n = static_cast<Eigen::Index>(slices.size());
    weight_.resize(n);
    sinAlpha_.resize(n);
    cosAlpha_.resize(n);
    width_.resize(n);
    arcLength_.resize(n);
    porePressure_.resize(n);
    cohesion_.resize(n);
    tanPhi_.resize(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        const Slice& slice = slices[static_cast<size_t>(i)];
        weight_(i) = slice.weight;
        sinAlpha_(i) = std::sin(slice.alpha);
        cosAlpha_(i) = std::cos(slice.alpha);
        width_(i) = slice.width;
        arcLength_(i) = slice.arcLength;
        porePressure_(i) = slice.porePressure;
        cohesion_(i) = slice.cohesion;
        tanPhi_(i) = std::tan(slice.frictionAngle * M_PI / 180.0);
    }
}

Eigen::ArrayXd SliceArrays::drivingForces() const {
    return weight_ * sinAlpha_;
}

double SliceArrays::checkedDrivingSum() const {
    double drivingSum = drivingForces().sum();
    if (!(drivingSum > 0.0)) {
        std::ostringstream message;
        message << "Sum of W*sin(alpha) is not positive (" << drivingSum
                << " kN/m): arc does not describe a sliding mass";
        throw InvalidSlipSurfaceError(drivingSum, message.str());
    }
    return drivingSum;
}
