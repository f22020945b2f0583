// src/utils/file_readers.h
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../calculators/stability_core/analysis_options.h"
#include "../calculators/stability_core/failure_circle.h"
#include "../calculators/stability_core/soil_layer.h"
#include "../calculators/stability_core/terrain_profile.h"

// Run configuration read from analysis_properties.txt
struct AnalysisProperties {
    AnalysisMode mode = AnalysisMode::Manual;
    AnalysisMethod method = AnalysisMethod::Both;
    SliceOptions sliceOptions;
    BishopOptions bishopOptions;

    // Manual mode
    std::optional<FailureCircle> circle;

    // Search mode
    SearchStrategy searchStrategy = SearchStrategy::Hybrid;
    int gridPoints = 8;
    int refinePoints = 5;
    int refinePasses = 2;
    int randomSamples = 300;
    int populationSize = 30;
    int generations = 25;
    double mutationRate = 0.2;
    double mutationScale = 0.1;
    double crossoverRate = 0.8;
    int tournamentSize = 3;
    unsigned int randomSeed = 42;
    bool requireGroundExit = true;

    // Search bound factors; any one given replaces the slope-class preset value
    std::optional<double> lateralMarginFactor;
    std::optional<double> centerHeightMinFactor;
    std::optional<double> centerHeightMaxFactor;
    std::optional<double> radiusMinFactor;
    std::optional<double> radiusMaxFactor;

    bool verbose = true;
};

class FileReaders {
public:
    // Load ground profile (x, y) from file
    static TerrainProfile loadTerrainFromFile(const std::string& filename);

    // Load piezometric line (x, y) from file
    static WaterTable loadWaterTableFromFile(const std::string& filename);

    // Load soil layers, top to bottom, from file
    static std::vector<SoilLayer> loadSoilLayersFromFile(const std::string& filename);

    // Load analysis properties from file
    static AnalysisProperties loadAnalysisPropertiesFromFile(const std::string& filename);
};
