// src/calculators/stability_core/stability_errors.h
#pragma once
#include <stdexcept>
#include <string>

// Base for every failure the stability engine reports
class StabilityError : public std::runtime_error {
public:
    explicit StabilityError(const std::string& message)
        : std::runtime_error(message) {}
};

// Soil, terrain or configuration input outside plausible ranges
class ParameterError : public StabilityError {
public:
    ParameterError(const std::string& parameter, double value, const std::string& message)
        : StabilityError(message), parameter_(parameter), value_(value) {}

    const std::string& parameter() const { return parameter_; }
    double value() const { return value_; }

private:
    std::string parameter_;
    double value_;
};

// Circle does not cut the terrain deeply enough to form a slice set
class GeometryError : public StabilityError {
public:
    GeometryError(int validSlices, const std::string& message)
        : StabilityError(message), validSlices_(validSlices) {}

    int validSlices() const { return validSlices_; }

private:
    int validSlices_;
};

// Driving sum W*sin(alpha) over the slice set is not positive
class InvalidSlipSurfaceError : public StabilityError {
public:
    InvalidSlipSurfaceError(double drivingSum, const std::string& message)
        : StabilityError(message), drivingSum_(drivingSum) {}

    double drivingSum() const { return drivingSum_; }

private:
    double drivingSum_;
};

// Bishop m_alpha became non-positive for a slice
class InvalidGeometryError : public StabilityError {
public:
    InvalidGeometryError(int sliceIndex, double mAlpha, double factorOfSafety,
                         const std::string& message)
        : StabilityError(message),
          sliceIndex_(sliceIndex),
          mAlpha_(mAlpha),
          factorOfSafety_(factorOfSafety) {}

    int sliceIndex() const { return sliceIndex_; }
    double mAlpha() const { return mAlpha_; }
    double factorOfSafety() const { return factorOfSafety_; }

private:
    int sliceIndex_;
    double mAlpha_;
    double factorOfSafety_;
};

// Bishop iteration budget exhausted before meeting the tolerance
class ConvergenceError : public StabilityError {
public:
    ConvergenceError(int iterations, double lastFactorOfSafety, double residual,
                     const std::string& message)
        : StabilityError(message),
          iterations_(iterations),
          lastFactorOfSafety_(lastFactorOfSafety),
          residual_(residual) {}

    int iterations() const { return iterations_; }
    double lastFactorOfSafety() const { return lastFactorOfSafety_; }
    double residual() const { return residual_; }

private:
    int iterations_;
    double lastFactorOfSafety_;
    double residual_;
};
