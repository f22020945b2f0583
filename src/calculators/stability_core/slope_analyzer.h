// src/calculators/stability_core/slope_analyzer.h
#pragma once
#include "analysis_results.h"
#include "circle_constraints.h"
#include "circle_search.h"
#include "failure_circle.h"
#include "slice_discretizer.h"
#include "soil_layer.h"
#include "terrain_profile.h"
#include "../../utils/file_readers.h"
#include <optional>
#include <vector>

// Entry point of the engine: manual circle analysis or critical circle search
class SlopeAnalyzer {
public:
    SlopeAnalyzer(const TerrainProfile& terrain,
                  const SoilProfile& soil,
                  const std::optional<WaterTable>& waterTable,
                  const AnalysisProperties& properties);

    // One result per method selected in the properties (Fellenius first when both).
    // Engine failures become the result status; a malformed circle throws ParameterError.
    std::vector<AnalysisResult> analyzeCircle(const FailureCircle& circle) const;

    // Single method; Both is rejected with ParameterError
    AnalysisResult analyzeCircle(const FailureCircle& circle, AnalysisMethod method) const;

    // Manual circle from the properties
    std::vector<AnalysisResult> runManual() const;

    // Factors from the properties, completed from the slope-class preset; absent when none are set
    std::optional<ConstraintFactors> constraintFactors() const;

    SearchBounds searchBounds() const;
    SearchConfig buildSearchConfig() const;

    SearchResult runSearch() const;
    SearchResult runSearch(const SearchConfig& config) const;

    const AnalysisProperties& properties() const { return properties_; }

private:
    std::vector<AnalysisResult> analyze(const FailureCircle& circle, bool withFellenius, bool withBishop) const;
    std::vector<std::string> geometryWarnings(const FailureCircle& circle) const;

    TerrainProfile terrain_;
    SoilProfile soil_;
    std::optional<WaterTable> waterTable_;
    AnalysisProperties properties_;
    SliceDiscretizer discretizer_;
};
