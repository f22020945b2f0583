// src/utils/validation/input_validator.cpp
#include "input_validator.h"
#include "../file_readers.h"
#include "../../calculators/stability_core/circle_constraints.h"
#include "../../calculators/stability_core/circle_search.h"
#include <cmath>

namespace {

const int MIN_SLICES = 5;
const int MAX_SLICES = 500;
const double MAX_FRICTION_ANGLE = 45.0;

void requireFinite(const std::string& parameter, double value) {
    if (!std::isfinite(value)) {
        throw ParameterError(parameter, value, parameter + " must be a finite number");
    }
}

void requireRange(const std::string& parameter, double value, double low, double high) {
    requireFinite(parameter, value);
    if (value < low || value > high) {
        throw ParameterError(parameter, value,
                             parameter + " = " + std::to_string(value) + " outside [" +
                             std::to_string(low) + ", " + std::to_string(high) + "]");
    }
}

void requirePositive(const std::string& parameter, double value) {
    requireFinite(parameter, value);
    if (value <= 0.0) {
        throw ParameterError(parameter, value, parameter + " must be > 0, got " + std::to_string(value));
    }
}

}

void InputValidator::validateProfilePoints(const std::vector<ProfilePoint>& points,
                                           const std::string& profileName) {
    if (points.size() < 2) {
        throw ParameterError(profileName + "_points", static_cast<double>(points.size()),
                             profileName + " profile needs at least 2 points");
    }

    for (size_t i = 0; i < points.size(); ++i) {
        requireFinite(profileName + "_x", points[i].x);
        requireFinite(profileName + "_y", points[i].y);
        if (i > 0 && points[i].x <= points[i - 1].x) {
            throw ParameterError(profileName + "_x", points[i].x,
                                 profileName + " x coordinates must be strictly increasing (point " +
                                 std::to_string(i) + ")");
        }
    }
}

void InputValidator::validateSoilLayer(const SoilLayer& layer) {
    requireFinite("cohesion", layer.cohesion);
    if (layer.cohesion < 0.0) {
        throw ParameterError("cohesion", layer.cohesion,
                             "Layer '" + layer.name + "': cohesion must be >= 0 kPa");
    }

    requireRange("friction_angle", layer.frictionAngle, 0.0, MAX_FRICTION_ANGLE);
    requirePositive("unit_weight", layer.unitWeight);

    if (layer.cohesion == 0.0 && layer.frictionAngle == 0.0) {
        throw ParameterError("cohesion", 0.0,
                             "Layer '" + layer.name + "' has neither cohesion nor friction");
    }

    if (layer.saturatedUnitWeight) {
        requireFinite("saturated_unit_weight", *layer.saturatedUnitWeight);
        if (*layer.saturatedUnitWeight <= layer.unitWeight) {
            throw ParameterError("saturated_unit_weight", *layer.saturatedUnitWeight,
                                 "Layer '" + layer.name + "': saturated unit weight must exceed unit weight");
        }
    }

    if (layer.bottomElevation) {
        requireFinite("bottom_elevation", *layer.bottomElevation);
    }
}

void InputValidator::validateSoilLayers(const std::vector<SoilLayer>& layers) {
    if (layers.empty()) {
        throw ParameterError("soil_layers", 0.0, "At least one soil layer is required");
    }

    for (size_t i = 0; i < layers.size(); ++i) {
        validateSoilLayer(layers[i]);

        bool isLast = (i + 1 == layers.size());
        if (!isLast && !layers[i].bottomElevation) {
            throw ParameterError("bottom_elevation", 0.0,
                                 "Only the last soil layer may omit its bottom elevation ('" +
                                 layers[i].name + "')");
        }
        if (i > 0 && layers[i].bottomElevation &&
            *layers[i].bottomElevation >= *layers[i - 1].bottomElevation) {
            throw ParameterError("bottom_elevation", *layers[i].bottomElevation,
                                 "Bottom elevations must strictly decrease downward ('" +
                                 layers[i].name + "')");
        }
    }
}

void InputValidator::validateCircle(const FailureCircle& circle) {
    requireFinite("circle_xc", circle.xc);
    requireFinite("circle_yc", circle.yc);
    requirePositive("circle_radius", circle.radius);
}

void InputValidator::validateSliceOptions(const SliceOptions& options) {
    if (options.numSlices < MIN_SLICES || options.numSlices > MAX_SLICES) {
        throw ParameterError("num_slices", options.numSlices,
                             "Number of slices must be within [" + std::to_string(MIN_SLICES) + ", " +
                             std::to_string(MAX_SLICES) + "]");
    }
    if (options.minValidSlices < 1 || options.minValidSlices > options.numSlices) {
        throw ParameterError("min_valid_slices", options.minValidSlices,
                             "Minimum valid slices must be within [1, num_slices]");
    }
    requireRange("max_base_angle", options.maxBaseAngle, 1.0, 89.0);
    requirePositive("unit_weight_water", options.unitWeightWater);
}

void InputValidator::validateBishopOptions(const BishopOptions& options) {
    requirePositive("bishop_tolerance", options.tolerance);
    if (options.maxIterations < 1) {
        throw ParameterError("bishop_max_iterations", options.maxIterations,
                             "Bishop iteration budget must be >= 1");
    }
}

void InputValidator::validateConstraintFactors(const ConstraintFactors& factors) {
    requireRange("lateral_margin_factor", factors.lateralMargin, 0.0, 10.0);
    requireRange("center_height_min_factor", factors.centerHeightMin, 0.0, 10.0);
    requireRange("center_height_max_factor", factors.centerHeightMax, 0.0, 10.0);
    requirePositive("radius_min_factor", factors.radiusMin);
    requirePositive("radius_max_factor", factors.radiusMax);

    if (factors.centerHeightMin >= factors.centerHeightMax) {
        throw ParameterError("center_height_min_factor", factors.centerHeightMin,
                             "Center height factors must satisfy min < max");
    }
    if (factors.radiusMin >= factors.radiusMax) {
        throw ParameterError("radius_min_factor", factors.radiusMin,
                             "Radius factors must satisfy min < max");
    }
}

void InputValidator::validateSearchBounds(const SearchBounds& bounds) {
    requireFinite("center_x_min", bounds.centerXMin);
    requireFinite("center_x_max", bounds.centerXMax);
    requireFinite("center_y_min", bounds.centerYMin);
    requireFinite("center_y_max", bounds.centerYMax);
    requirePositive("radius_min", bounds.radiusMin);
    requireFinite("radius_max", bounds.radiusMax);

    if (bounds.centerXMin > bounds.centerXMax) {
        throw ParameterError("center_x_min", bounds.centerXMin, "Search bounds: center x min > max");
    }
    if (bounds.centerYMin > bounds.centerYMax) {
        throw ParameterError("center_y_min", bounds.centerYMin, "Search bounds: center y min > max");
    }
    if (bounds.radiusMin > bounds.radiusMax) {
        throw ParameterError("radius_min", bounds.radiusMin, "Search bounds: radius min > max");
    }
}

void InputValidator::validateSearchConfig(const SearchConfig& config) {
    validateSliceOptions(config.sliceOptions);
    validateBishopOptions(config.bishopOptions);

    if (config.gridPoints < 2) {
        throw ParameterError("grid_points", config.gridPoints, "Grid needs at least 2 points per axis");
    }
    if (config.refinePoints < 2) {
        throw ParameterError("refine_points", config.refinePoints,
                             "Refinement grid needs at least 2 points per axis");
    }
    if (config.refinePasses < 0) {
        throw ParameterError("refine_passes", config.refinePasses, "Refinement passes must be >= 0");
    }
    if (!(config.refineFactor > 0.0 && config.refineFactor <= 1.0)) {
        throw ParameterError("refine_factor", config.refineFactor, "Refinement factor must be within (0, 1]");
    }
    if (config.randomSamples < 1) {
        throw ParameterError("random_samples", config.randomSamples, "Random samples must be >= 1");
    }
    if (config.populationSize < 2) {
        throw ParameterError("population_size", config.populationSize, "Population size must be >= 2");
    }
    if (config.generations < 1) {
        throw ParameterError("generations", config.generations, "Generations must be >= 1");
    }
    requireRange("mutation_rate", config.mutationRate, 0.0, 1.0);
    requireRange("mutation_scale", config.mutationScale, 0.0, 1.0);
    requireRange("crossover_rate", config.crossoverRate, 0.0, 1.0);
    if (config.tournamentSize < 1) {
        throw ParameterError("tournament_size", config.tournamentSize, "Tournament size must be >= 1");
    }
    if (config.patternIterations < 0) {
        throw ParameterError("pattern_iterations", config.patternIterations,
                             "Pattern search iterations must be >= 0");
    }
    for (const auto& hint : config.hintCircles) {
        validateCircle(hint);
    }
}

void InputValidator::validateAnalysisProperties(const AnalysisProperties& properties) {
    validateSliceOptions(properties.sliceOptions);
    validateBishopOptions(properties.bishopOptions);

    if (properties.mode == AnalysisMode::Manual) {
        if (!properties.circle) {
            throw ParameterError("circle", 0.0,
                                 "Manual mode needs circle_xc, circle_yc and circle_radius");
        }
        validateCircle(*properties.circle);
    }

    const std::optional<double> factors[] = {
        properties.lateralMarginFactor, properties.centerHeightMinFactor,
        properties.centerHeightMaxFactor, properties.radiusMinFactor, properties.radiusMaxFactor};
    for (const auto& factor : factors) {
        if (factor) {
            requireRange("bound_factor", *factor, 0.0, 10.0);
        }
    }
}
