// src/utils/file_readers.cpp
#include "file_readers.h"
#include "../calculators/stability_core/stability_errors.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

double parseDouble(std::string token, const std::string& field, const std::string& filename) {
    // Replace comma with dot for decimal point
    std::replace(token.begin(), token.end(), ',', '.');
    try {
        size_t consumed = 0;
        double value = std::stod(token, &consumed);
        if (token.find_first_not_of(" \r", consumed) != std::string::npos) {
            throw std::invalid_argument(token);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ParameterError(field, 0.0, "Malformed value '" + token + "' for " + field + " in " + filename);
    } catch (const std::out_of_range&) {
        throw ParameterError(field, 0.0, "Value out of range '" + token + "' for " + field + " in " + filename);
    }
}

int parseInt(const std::string& token, const std::string& field, const std::string& filename) {
    double value = parseDouble(token, field, filename);
    if (!std::isfinite(value) || value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        throw ParameterError(field, value, "Integer out of range for " + field + " in " + filename);
    }
    if (std::floor(value) != value) {
        throw ParameterError(field, value, "Expected an integer for " + field + " in " + filename);
    }
    return static_cast<int>(value);
}

bool parseBool(const std::string& token) {
    return token == "True" || token == "true" || token == "TRUE" || token == "1";
}

// '-' or an empty cell marks an absent optional value
std::optional<double> parseOptional(const std::string& token, const std::string& field,
                                    const std::string& filename) {
    if (token.empty() || token == "-" || token == "\r") {
        return std::nullopt;
    }
    return parseDouble(token, field, filename);
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \r");
    return text.substr(first, last - first + 1);
}

std::vector<ProfilePoint> loadPointsFromFile(const std::string& filename, const std::string& description) {
    std::vector<ProfilePoint> points;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + description + " file: " + filename);
    }

    // Skip header lines (first 2 lines)
    std::string line;
    std::getline(file, line); // Column names
    std::getline(file, line); // Units

    // Read data
    while (std::getline(file, line)) {
        if (trim(line).empty()) {
            continue;
        }
        std::stringstream ss(line);
        std::string token;

        ProfilePoint point;

        // Parse x
        std::getline(ss, token, '\t');
        point.x = parseDouble(trim(token), "x", filename);

        // Parse y
        if (!std::getline(ss, token, '\t')) {
            throw ParameterError("y", 0.0, "Missing elevation column in " + filename);
        }
        point.y = parseDouble(trim(token), "y", filename);

        points.push_back(point);
    }

    return points;
}

}

TerrainProfile FileReaders::loadTerrainFromFile(const std::string& filename) {
    return TerrainProfile(loadPointsFromFile(filename, "terrain"));
}

WaterTable FileReaders::loadWaterTableFromFile(const std::string& filename) {
    return WaterTable(loadPointsFromFile(filename, "water table"));
}

std::vector<SoilLayer> FileReaders::loadSoilLayersFromFile(const std::string& filename) {
    std::vector<SoilLayer> layers;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Could not open soil layers file: " + filename);
    }

    // Skip header lines (first 2 lines)
    std::string line;
    std::getline(file, line); // Column names
    std::getline(file, line); // Units

    // Read data
    while (std::getline(file, line)) {
        if (trim(line).empty()) {
            continue;
        }
        std::stringstream ss(line);
        std::string token;

        SoilLayer layer;

        // Parse layer name
        std::getline(ss, token, '\t');
        layer.name = trim(token);

        // Parse cohesion
        std::getline(ss, token, '\t');
        layer.cohesion = parseDouble(trim(token), "cohesion", filename);

        // Parse friction angle
        std::getline(ss, token, '\t');
        layer.frictionAngle = parseDouble(trim(token), "friction_angle", filename);

        // Parse unit weight
        std::getline(ss, token, '\t');
        layer.unitWeight = parseDouble(trim(token), "unit_weight", filename);

        // Parse saturated unit weight (optional)
        token.clear();
        std::getline(ss, token, '\t');
        layer.saturatedUnitWeight = parseOptional(trim(token), "saturated_unit_weight", filename);

        // Parse bottom elevation (optional)
        token.clear();
        std::getline(ss, token, '\t');
        layer.bottomElevation = parseOptional(trim(token), "bottom_elevation", filename);

        layers.push_back(layer);
    }

    return layers;
}

AnalysisProperties FileReaders::loadAnalysisPropertiesFromFile(const std::string& filename) {
    AnalysisProperties properties;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Could not open analysis properties file: " + filename);
    }

    std::optional<double> circleXc;
    std::optional<double> circleYc;
    std::optional<double> circleRadius;

    // Skip header lines (first 2 lines)
    std::string line;
    std::getline(file, line); // Column names
    std::getline(file, line); // Units

    // Read data
    while (std::getline(file, line)) {
        if (trim(line).empty()) {
            continue;
        }
        std::stringstream ss(line);
        std::string propName, value, unit;

        std::getline(ss, propName, '\t');
        std::getline(ss, value, '\t');
        std::getline(ss, unit, '\t');

        propName = trim(propName);
        value = trim(value);

        if (propName == "num_slices") {
            properties.sliceOptions.numSlices = parseInt(value, propName, filename);
        } else if (propName == "method") {
            properties.method = parseMethod(value);
        } else if (propName == "bishop_tolerance") {
            properties.bishopOptions.tolerance = parseDouble(value, propName, filename);
        } else if (propName == "bishop_max_iterations") {
            properties.bishopOptions.maxIterations = parseInt(value, propName, filename);
        } else if (propName == "unit_weight_water") {
            properties.sliceOptions.unitWeightWater = parseDouble(value, propName, filename);
        } else if (propName == "max_base_angle") {
            properties.sliceOptions.maxBaseAngle = parseDouble(value, propName, filename);
        } else if (propName == "min_valid_slices") {
            properties.sliceOptions.minValidSlices = parseInt(value, propName, filename);
        } else if (propName == "mode") {
            properties.mode = parseMode(value);
        } else if (propName == "circle_xc") {
            circleXc = parseDouble(value, propName, filename);
        } else if (propName == "circle_yc") {
            circleYc = parseDouble(value, propName, filename);
        } else if (propName == "circle_radius") {
            circleRadius = parseDouble(value, propName, filename);
        } else if (propName == "search_strategy") {
            properties.searchStrategy = parseStrategy(value);
        } else if (propName == "grid_points") {
            properties.gridPoints = parseInt(value, propName, filename);
        } else if (propName == "refine_points") {
            properties.refinePoints = parseInt(value, propName, filename);
        } else if (propName == "refine_passes") {
            properties.refinePasses = parseInt(value, propName, filename);
        } else if (propName == "random_samples") {
            properties.randomSamples = parseInt(value, propName, filename);
        } else if (propName == "population_size") {
            properties.populationSize = parseInt(value, propName, filename);
        } else if (propName == "generations") {
            properties.generations = parseInt(value, propName, filename);
        } else if (propName == "mutation_rate") {
            properties.mutationRate = parseDouble(value, propName, filename);
        } else if (propName == "mutation_scale") {
            properties.mutationScale = parseDouble(value, propName, filename);
        } else if (propName == "crossover_rate") {
            properties.crossoverRate = parseDouble(value, propName, filename);
        } else if (propName == "tournament_size") {
            properties.tournamentSize = parseInt(value, propName, filename);
        } else if (propName == "random_seed") {
            int seed = parseInt(value, propName, filename);
            if (seed < 0) {
                throw ParameterError(propName, seed, "random_seed must be >= 0");
            }
            properties.randomSeed = static_cast<unsigned int>(seed);
        } else if (propName == "require_ground_exit") {
            properties.requireGroundExit = parseBool(value);
        } else if (propName == "lateral_margin_factor") {
            properties.lateralMarginFactor = parseDouble(value, propName, filename);
        } else if (propName == "center_height_min_factor") {
            properties.centerHeightMinFactor = parseDouble(value, propName, filename);
        } else if (propName == "center_height_max_factor") {
            properties.centerHeightMaxFactor = parseDouble(value, propName, filename);
        } else if (propName == "radius_min_factor") {
            properties.radiusMinFactor = parseDouble(value, propName, filename);
        } else if (propName == "radius_max_factor") {
            properties.radiusMaxFactor = parseDouble(value, propName, filename);
        } else if (propName == "verbose") {
            properties.verbose = parseBool(value);
        }
    }

    if (circleXc || circleYc || circleRadius) {
        if (!circleXc || !circleYc || !circleRadius) {
            throw ParameterError("circle", 0.0,
                                 "circle_xc, circle_yc and circle_radius must be given together in " + filename);
        }
        properties.circle = FailureCircle{*circleXc, *circleYc, *circleRadius};
    }

    return properties;
}
