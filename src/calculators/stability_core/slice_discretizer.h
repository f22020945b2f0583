// src/calculators/stability_core/slice_discretizer.h
#pragma once
#include "analysis_options.h"
#include "failure_circle.h"
#include "slice.h"
#include "soil_layer.h"
#include "terrain_profile.h"
#include <optional>
#include <vector>

// Cuts the soil mass above a circular arc into vertical slices
class SliceDiscretizer {
public:
    SliceDiscretizer(const TerrainProfile& terrain,
                     const SoilProfile& soil,
                     const std::optional<WaterTable>& waterTable,
                     const SliceOptions& options);

    // Throws GeometryError when fewer than minValidSlices slices remain
    std::vector<Slice> discretize(const FailureCircle& circle) const;

    // Elevation of the arc beneath the center; absent beyond the circle's x-extent
    static std::optional<double> baseElevation(const FailureCircle& circle, double x);

    // Signed base inclination (radians) for a terrain sliding in slideDirection
    static double baseAngle(const FailureCircle& circle, double x, int slideDirection);

    static double arcLength(const FailureCircle& circle, double xLeft, double xRight);

    const TerrainProfile& terrain() const { return terrain_; }
    const SliceOptions& options() const { return options_; }

private:
    TerrainProfile terrain_;
    SoilProfile soil_;
    std::optional<WaterTable> waterTable_;
    SliceOptions options_;
    int slideDirection_;
};
