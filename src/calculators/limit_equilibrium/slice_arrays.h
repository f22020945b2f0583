// src/calculators/limit_equilibrium/slice_arrays.h
#pragma once
#include "../stability_core/slice.h"
#include <Eigen/Dense>
#include <vector>

// Column view of a slice set for coefficient-wise force sums
class SliceArrays {
public:
    explicit SliceArrays(const std::vector<Slice>& slices);

    Eigen::Index size() const { return weight_.size(); }

    // W sin(alpha) per slice
    Eigen::ArrayXd drivingForces() const;

    // Throws InvalidSlipSurfaceError when the sum is not positive
    double checkedDrivingSum() const;

    const Eigen::ArrayXd& weight() const { return weight_; }
    const Eigen::ArrayXd& sinAlpha() const { return sinAlpha_; }
    const Eigen::ArrayXd& cosAlpha() const { return cosAlpha_; }
    const Eigen::ArrayXd& width() const { return width_; }
    const Eigen::ArrayXd& arcLength() const { return arcLength_; }
    const Eigen::ArrayXd& porePressure() const { return porePressure_; }
    const Eigen::ArrayXd& cohesion() const { return cohesion_; }
    const Eigen::ArrayXd& tanPhi() const { return tanPhi_; }

private:
    Eigen::ArrayXd weight_;
    Eigen::ArrayXd sinAlpha_;
    Eigen::ArrayXd cosAlpha_;
    Eigen::ArrayXd width_;
    Eigen::ArrayXd arcLength_;
    Eigen::ArrayXd porePressure_;
    Eigen::ArrayXd cohesion_;
    Eigen::ArrayXd tanPhi_;
};
