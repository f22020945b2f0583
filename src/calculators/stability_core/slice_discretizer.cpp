// src/calculators/stability_core/slice_discretizer.cpp
#include "slice_discretizer.h"
#include "stability_errors.h"
#include "../../utils/validation/input_validator.h"
#include <algorithm>
#include <cmath>

namespace {

double clampUnit(double value) {
    return std::max(-1.0, std::min(1.0, value));
}

}

SliceDiscretizer::SliceDiscretizer(const TerrainProfile& terrain,
                                   const SoilProfile& soil,
                                   const std::optional<WaterTable>& waterTable,
                                   const SliceOptions& options)
    : terrain_(terrain),
      soil_(soil),
      waterTable_(waterTable),
      options_(options),
      slideDirection_(terrain.slideDirection()) {
    InputValidator::validateSliceOptions(options_);
}

std::optional<double> SliceDiscretizer::baseElevation(const FailureCircle& circle, double x) {
    double dx = x - circle.xc;
    double discriminant = circle.radius * circle.radius - dx * dx;
    if (discriminant < 0.0) {
        return std::nullopt;
    }
    return circle.yc - std::sqrt(discriminant);
}

double SliceDiscretizer::baseAngle(const FailureCircle& circle, double x, int slideDirection) {
    return std::asin(clampUnit(slideDirection * (circle.xc - x) / circle.radius));
}

double SliceDiscretizer::arcLength(const FailureCircle& circle, double xLeft, double xRight) {
    double thetaLeft = std::asin(clampUnit((xLeft - circle.xc) / circle.radius));
    double thetaRight = std::asin(clampUnit((xRight - circle.xc) / circle.radius));
    return circle.radius * std::abs(thetaRight - thetaLeft);
}

std::vector<Slice> SliceDiscretizer::discretize(const FailureCircle& circle) const {
    InputValidator::validateCircle(circle);

    double xStart = std::max(circle.xc - circle.radius, terrain_.xMin());
    double xEnd = std::min(circle.xc + circle.radius, terrain_.xMax());
    if (xEnd - xStart <= 0.0) {
        throw GeometryError(0, "Failure circle does not overlap the terrain profile");
    }

    const int n = options_.numSlices;
    const double width = (xEnd - xStart) / n;
    const double maxAlpha = options_.maxBaseAngle * M_PI / 180.0;

    std::vector<Slice> slices;
    slices.reserve(n);

    for (int i = 0; i < n; ++i) {
        double xLeft = xStart + i * width;
        double xRight = (i == n - 1) ? xEnd : xStart + (i + 1) * width;
        double sliceWidth = xRight - xLeft;
        if (sliceWidth <= 0.0) {
            continue;
        }

        double xCenter = 0.5 * (xLeft + xRight);
        std::optional<double> yBase = baseElevation(circle, xCenter);
        std::optional<double> ySurface = terrain_.elevationAt(xCenter);
        if (!yBase || !ySurface) {
            continue;
        }

        double height = *ySurface - *yBase;
        if (height <= 0.0) {
            continue;
        }

        double alpha = baseAngle(circle, xCenter, slideDirection_);
        if (std::abs(alpha) > maxAlpha) {
            continue;
        }

        std::optional<double> yWater;
        if (waterTable_) {
            yWater = waterTable_->elevationAt(xCenter);
        }

        const SoilLayer& baseLayer = soil_.layerAt(*yBase);

        Slice slice;
        slice.index = static_cast<int>(slices.size());
        slice.xLeft = xLeft;
        slice.xRight = xRight;
        slice.xCenter = xCenter;
        slice.width = sliceWidth;
        slice.yBase = *yBase;
        slice.ySurface = *ySurface;
        slice.height = height;
        slice.alpha = alpha;
        slice.arcLength = arcLength(circle, xLeft, xRight);
        slice.weight = soil_.columnWeight(*yBase, *ySurface, sliceWidth, yWater);
        slice.porePressure = yWater ? std::max(0.0, *yWater - *yBase) * options_.unitWeightWater : 0.0;
        slice.cohesion = baseLayer.cohesion;
        slice.frictionAngle = baseLayer.frictionAngle;
        slices.push_back(slice);
    }

    if (static_cast<int>(slices.size()) < options_.minValidSlices) {
        throw GeometryError(static_cast<int>(slices.size()),
                            "Only " + std::to_string(slices.size()) + " valid slices (minimum " +
                            std::to_string(options_.minValidSlices) + ")");
    }

    return slices;
}
