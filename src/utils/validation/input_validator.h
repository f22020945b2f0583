// src/utils/validation/input_validator.h
#pragma once
#include "../../calculators/stability_core/analysis_options.h"
#include "../../calculators/stability_core/failure_circle.h"
#include "../../calculators/stability_core/soil_layer.h"
#include "../../calculators/stability_core/stability_errors.h"
#include "../../calculators/stability_core/terrain_profile.h"
#include <string>
#include <vector>

struct AnalysisProperties;
struct ConstraintFactors;
struct SearchConfig;

// Range checks on every engine input; each throws ParameterError naming the offending value
class InputValidator {
public:
    static void validateProfilePoints(const std::vector<ProfilePoint>& points, const std::string& profileName);

    static void validateSoilLayer(const SoilLayer& layer);
    static void validateSoilLayers(const std::vector<SoilLayer>& layers);

    static void validateCircle(const FailureCircle& circle);

    static void validateSliceOptions(const SliceOptions& options);
    static void validateBishopOptions(const BishopOptions& options);

    static void validateConstraintFactors(const ConstraintFactors& factors);
    static void validateSearchBounds(const SearchBounds& bounds);
    static void validateSearchConfig(const SearchConfig& config);

    static void validateAnalysisProperties(const AnalysisProperties& properties);
};
