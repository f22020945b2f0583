// src/calculators/stability_core/analysis_options.h
#pragma once
#include <string>

enum class AnalysisMethod {
    Fellenius,
    Bishop,
    Both
};

enum class AnalysisMode {
    Manual,
    Search
};

enum class SearchStrategy {
    Grid,
    Random,
    Genetic,
    Hybrid
};

std::string methodName(AnalysisMethod method);
std::string strategyName(SearchStrategy strategy);

// Throw ParameterError for unknown names
AnalysisMethod parseMethod(const std::string& name);
AnalysisMode parseMode(const std::string& name);
SearchStrategy parseStrategy(const std::string& name);

struct SliceOptions {
    int numSlices = 20;              // Columns across the effective x-range
    double maxBaseAngle = 80.0;      // Slices with |alpha| above this are dropped (degrees)
    int minValidSlices = 5;
    double unitWeightWater = 9.81;   // γw in kN/m³
};

struct BishopOptions {
    double tolerance = 0.001;
    int maxIterations = 100;
};
