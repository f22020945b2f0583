// src/calculators/main.cpp
#include <iostream>
#include <filesystem>
#include <optional>
#include "stability_core/slope_analyzer.h"
#include "../utils/file_readers.h"
#include "../utils/validation/input_validator.h"

int main(int argc, char* argv[]) {
    try {
        std::string dataDir = (argc > 1) ? argv[1] : "calculators/data";
        std::string resultsDir = (argc > 2) ? argv[2] : "calculators/results";

        // Load data from files
        std::string terrainFile = dataDir + "/terrain.txt";
        std::string soilLayersFile = dataDir + "/soil_layers.txt";
        std::string waterTableFile = dataDir + "/water_table.txt";
        std::string propertiesFile = dataDir + "/analysis_properties.txt";

        std::cout << "Loading terrain profile..." << std::endl;
        TerrainProfile terrain = FileReaders::loadTerrainFromFile(terrainFile);
        std::cout << "Loaded " << terrain.points().size() << " terrain points." << std::endl;

        std::cout << "Loading soil layers..." << std::endl;
        SoilProfile soil(FileReaders::loadSoilLayersFromFile(soilLayersFile));
        std::cout << "Loaded " << soil.layers().size() << " soil layers." << std::endl;

        std::optional<WaterTable> waterTable;
        if (std::filesystem::exists(waterTableFile)) {
            std::cout << "Loading water table..." << std::endl;
            waterTable = FileReaders::loadWaterTableFromFile(waterTableFile);
            std::cout << "Loaded " << waterTable->points().size() << " water table points." << std::endl;
        } else {
            std::cout << "No water table file, analysing dry slope." << std::endl;
        }

        std::cout << "Loading analysis properties..." << std::endl;
        AnalysisProperties properties = FileReaders::loadAnalysisPropertiesFromFile(propertiesFile);
        InputValidator::validateAnalysisProperties(properties);

        SlopeAnalyzer analyzer(terrain, soil, waterTable, properties);

        // Create output directory if it doesn't exist
        std::filesystem::create_directories(resultsDir);

        if (properties.mode == AnalysisMode::Manual) {
            std::cout << "Analysing circle (" << properties.circle->xc << ", " << properties.circle->yc
                      << ") r = " << properties.circle->radius << " m..." << std::endl;

            for (const auto& result : analyzer.runManual()) {
                result.printSummary();
                result.writeSlicesToFile(resultsDir);
            }
        } else {
            std::cout << "Searching for the critical circle..." << std::endl;
            SearchResult search = analyzer.runSearch();
            search.printSummary();
            search.writeHistoryToFile(resultsDir);

            if (search.bestAnalysis) {
                search.bestAnalysis->printSummary();
                search.bestAnalysis->writeSlicesToFile(resultsDir);
            }
        }

        std::cout << "Calculation complete. Results written to '" << resultsDir << "/' directory." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
