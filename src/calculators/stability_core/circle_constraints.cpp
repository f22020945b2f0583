// src/calculators/stability_core/circle_constraints.cpp
#include "circle_constraints.h"
#include "slice_discretizer.h"
#include "stability_errors.h"
#include "../../utils/validation/input_validator.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <random>

std::string slopeClassName(SlopeClass slopeClass) {
    switch (slopeClass) {
        case SlopeClass::Gentle: return "gentle";
        case SlopeClass::Steep: return "steep";
        case SlopeClass::Critical: return "critical";
        case SlopeClass::Conservative: return "conservative";
    }
    return "unknown";
}

std::string violationName(BoundViolation violation) {
    switch (violation) {
        case BoundViolation::CenterXBelowMin: return "center x below minimum";
        case BoundViolation::CenterXAboveMax: return "center x above maximum";
        case BoundViolation::CenterYBelowMin: return "center y below minimum";
        case BoundViolation::CenterYAboveMax: return "center y above maximum";
        case BoundViolation::RadiusBelowMin: return "radius below minimum";
        case BoundViolation::RadiusAboveMax: return "radius above maximum";
    }
    return "unknown";
}

SlopeClass CircleConstraintCalculator::classifySlope(double faceAngleDegrees) {
    if (faceAngleDegrees <= 15.0) return SlopeClass::Gentle;
    if (faceAngleDegrees <= 30.0) return SlopeClass::Steep;
    if (faceAngleDegrees <= 50.0) return SlopeClass::Critical;
    return SlopeClass::Conservative;
}

ConstraintFactors CircleConstraintCalculator::presetFactors(SlopeClass slopeClass) {
    // {lateral margin, center height min, center height max, radius min, radius max} x H
    switch (slopeClass) {
        case SlopeClass::Gentle: return {0.8, 0.3, 2.0, 0.8, 2.5};
        case SlopeClass::Steep: return {0.5, 0.3, 2.5, 0.8, 2.2};
        case SlopeClass::Critical: return {0.3, 0.3, 2.0, 0.8, 2.0};
        case SlopeClass::Conservative: return {0.2, 0.3, 1.5, 0.8, 1.8};
    }
    return {0.6, 0.3, 2.0, 0.8, 2.5};
}

SearchBounds CircleConstraintCalculator::calculateBounds(const TerrainProfile& terrain,
                                                         const std::optional<ConstraintFactors>& factors) {
    SlopeGeometry geometry = terrain.slopeGeometry();
    if (geometry.height <= 0.0) {
        throw ParameterError("slope_height", geometry.height,
                             "Terrain profile has no relief; search bounds are undefined");
    }

    ConstraintFactors f = factors ? *factors : presetFactors(classifySlope(geometry.faceAngle));
    InputValidator::validateConstraintFactors(f);

    const double H = geometry.height;
    double xLow = std::min(geometry.toeX, geometry.crestX);
    double xHigh = std::max(geometry.toeX, geometry.crestX);

    SearchBounds bounds;
    bounds.centerXMin = xLow - f.lateralMargin * H;
    bounds.centerXMax = xHigh + f.lateralMargin * H;
    bounds.centerYMin = geometry.yMax + f.centerHeightMin * H;
    bounds.centerYMax = geometry.yMax + f.centerHeightMax * H;
    bounds.radiusMin = f.radiusMin * H;
    bounds.radiusMax = f.radiusMax * H;
    bounds.geometry = geometry;
    return bounds;
}

CircleValidation CircleConstraintCalculator::validateAndCorrect(const FailureCircle& circle,
                                                                const SearchBounds& bounds,
                                                                bool autoCorrect) {
    CircleValidation validation;
    FailureCircle corrected = circle;

    if (circle.xc < bounds.centerXMin) {
        validation.violations.push_back(BoundViolation::CenterXBelowMin);
        corrected.xc = bounds.centerXMin;
    } else if (circle.xc > bounds.centerXMax) {
        validation.violations.push_back(BoundViolation::CenterXAboveMax);
        corrected.xc = bounds.centerXMax;
    }

    if (circle.yc < bounds.centerYMin) {
        validation.violations.push_back(BoundViolation::CenterYBelowMin);
        corrected.yc = bounds.centerYMin;
    } else if (circle.yc > bounds.centerYMax) {
        validation.violations.push_back(BoundViolation::CenterYAboveMax);
        corrected.yc = bounds.centerYMax;
    }

    if (circle.radius < bounds.radiusMin) {
        validation.violations.push_back(BoundViolation::RadiusBelowMin);
        corrected.radius = bounds.radiusMin;
    } else if (circle.radius > bounds.radiusMax) {
        validation.violations.push_back(BoundViolation::RadiusAboveMax);
        corrected.radius = bounds.radiusMax;
    }

    validation.isValid = validation.violations.empty();
    if (autoCorrect) {
        validation.correctedCircle = corrected;
    }
    return validation;
}

std::vector<ProfilePoint> CircleConstraintCalculator::terrainIntersections(const FailureCircle& circle,
                                                                           const TerrainProfile& terrain) {
    const Eigen::Vector2d center(circle.xc, circle.yc);
    const double r2 = circle.radius * circle.radius;
    const auto& points = terrain.points();

    std::vector<ProfilePoint> intersections;
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        Eigen::Vector2d p1(points[i].x, points[i].y);
        Eigen::Vector2d d = Eigen::Vector2d(points[i + 1].x, points[i + 1].y) - p1;
        Eigen::Vector2d f = p1 - center;

        // |p1 + t d - c|² = r² as a quadratic in t
        double a = d.squaredNorm();
        double b = 2.0 * f.dot(d);
        double c = f.squaredNorm() - r2;
        double discriminant = b * b - 4.0 * a * c;
        if (discriminant < 0.0) {
            continue;
        }

        double root = std::sqrt(discriminant);
        for (double t : {(-b - root) / (2.0 * a), (-b + root) / (2.0 * a)}) {
            if (t < -1e-12 || t > 1.0 + 1e-12) {
                continue;
            }
            Eigen::Vector2d p = p1 + std::max(0.0, std::min(1.0, t)) * d;
            intersections.push_back({p.x(), p.y()});
        }
    }

    std::sort(intersections.begin(), intersections.end(),
              [](const ProfilePoint& a, const ProfilePoint& b) { return a.x < b.x; });

    // Tangencies and shared segment vertices produce duplicates
    auto last = std::unique(intersections.begin(), intersections.end(),
                            [](const ProfilePoint& a, const ProfilePoint& b) {
                                return std::abs(a.x - b.x) < 1e-9 && std::abs(a.y - b.y) < 1e-9;
                            });
    intersections.erase(last, intersections.end());
    return intersections;
}

bool CircleConstraintCalculator::exitsGround(const FailureCircle& circle, const TerrainProfile& terrain) {
    const double TOLERANCE = 1e-6;

    double xStart = std::max(circle.xc - circle.radius, terrain.xMin());
    double xEnd = std::min(circle.xc + circle.radius, terrain.xMax());
    if (xEnd <= xStart) {
        return false;
    }

    // The arc must be at or above the ground at both ends of the overlap
    for (double x : {xStart, xEnd}) {
        std::optional<double> ground = terrain.elevationAt(x);
        std::optional<double> arc = SliceDiscretizer::baseElevation(circle, x);
        if (!ground || !arc || *ground - *arc > TOLERANCE) {
            return false;
        }
    }

    std::vector<ProfilePoint> crossings = terrainIntersections(circle, terrain);
    long lowerCrossings = std::count_if(crossings.begin(), crossings.end(), [&](const ProfilePoint& p) {
        return p.y <= circle.yc + TOLERANCE;
    });
    return lowerCrossings >= 2;
}

std::vector<FailureCircle> CircleConstraintCalculator::generateCircles(const SearchBounds& bounds,
                                                                       int count,
                                                                       SamplingDistribution distribution,
                                                                       unsigned int seed) {
    if (count <= 0) {
        throw ParameterError("count", count, "Number of circles to generate must be > 0");
    }

    std::mt19937 rng(seed);
    std::vector<FailureCircle> circles;
    circles.reserve(static_cast<size_t>(count));

    auto sample = [&](double low, double high) {
        if (distribution == SamplingDistribution::Uniform) {
            std::uniform_real_distribution<double> uniform(low, high);
            return uniform(rng);
        }
        double sigma = (high - low) / 6.0;
        if (sigma <= 0.0) {
            return low;
        }
        std::normal_distribution<double> gaussian(0.5 * (low + high), sigma);
        return std::max(low, std::min(high, gaussian(rng)));
    };

    for (int i = 0; i < count; ++i) {
        FailureCircle circle;
        circle.xc = sample(bounds.centerXMin, bounds.centerXMax);
        circle.yc = sample(bounds.centerYMin, bounds.centerYMax);
        circle.radius = sample(bounds.radiusMin, bounds.radiusMax);
        circles.push_back(circle);
    }
    return circles;
}
