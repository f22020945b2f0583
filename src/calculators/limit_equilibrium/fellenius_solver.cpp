// src/calculators/limit_equilibrium/fellenius_solver.cpp
#include "fellenius_solver.h"
#include "../stability_core/stability_errors.h"
#include <cmath>
#include <sstream>

FelleniusSolver::FelleniusSolver(const std::vector<Slice>& slices)
    : slices_(slices), arrays_(slices) {}

AnalysisResult FelleniusSolver::solve() const {
    double drivingSum = arrays_.checkedDrivingSum();
    Eigen::ArrayXd driving = arrays_.drivingForces();

    // Effective normal force on the base, clipped at zero where the slice is in tension
    Eigen::ArrayXd normal = arrays_.weight() * arrays_.cosAlpha() -
                            arrays_.porePressure() * arrays_.arcLength();
    Eigen::ArrayXd resisting = arrays_.cohesion() * arrays_.arcLength() +
                               normal.max(0.0) * arrays_.tanPhi();

    double resistingSum = resisting.sum();
    if (!(resistingSum > 0.0) || !std::isfinite(resistingSum)) {
        std::ostringstream message;
        message << "No shear resistance along the slip surface (sum = " << resistingSum
                << " kN/m): pore pressure cancels the friction of a cohesionless soil";
        throw ParameterError("shear_resistance", resistingSum, message.str());
    }

    AnalysisResult result;
    result.method = AnalysisMethod::Fellenius;
    result.status = AnalysisStatus::Valid;
    result.factorOfSafety = resistingSum / drivingSum;

    result.slices.reserve(slices_.size());
    for (size_t i = 0; i < slices_.size(); ++i) {
        const Slice& slice = slices_[i];
        Eigen::Index k = static_cast<Eigen::Index>(i);

        SliceDiagnostic diagnostic;
        diagnostic.index = slice.index;
        diagnostic.xCenter = slice.xCenter;
        diagnostic.width = slice.width;
        diagnostic.height = slice.height;
        diagnostic.alphaDegrees = slice.alpha * 180.0 / M_PI;
        diagnostic.weight = slice.weight;
        diagnostic.porePressure = slice.porePressure;
        diagnostic.resistingForce = resisting(k);
        diagnostic.drivingForce = driving(k);
        diagnostic.inTension = normal(k) < 0.0;
        result.slices.push_back(diagnostic);
    }

    return result;
}
