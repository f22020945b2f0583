// src/calculators/stability_core/analysis_options.cpp
#include "analysis_options.h"
#include "stability_errors.h"
#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}

std::string methodName(AnalysisMethod method) {
    switch (method) {
        case AnalysisMethod::Fellenius: return "Fellenius";
        case AnalysisMethod::Bishop: return "Bishop";
        case AnalysisMethod::Both: return "Both";
    }
    return "Unknown";
}

std::string strategyName(SearchStrategy strategy) {
    switch (strategy) {
        case SearchStrategy::Grid: return "Grid";
        case SearchStrategy::Random: return "Random";
        case SearchStrategy::Genetic: return "Genetic";
        case SearchStrategy::Hybrid: return "Hybrid";
    }
    return "Unknown";
}

AnalysisMethod parseMethod(const std::string& name) {
    std::string key = toLower(name);
    if (key == "fellenius") return AnalysisMethod::Fellenius;
    if (key == "bishop") return AnalysisMethod::Bishop;
    if (key == "both") return AnalysisMethod::Both;
    throw ParameterError("method", 0.0, "Unknown analysis method: " + name);
}

AnalysisMode parseMode(const std::string& name) {
    std::string key = toLower(name);
    if (key == "manual") return AnalysisMode::Manual;
    if (key == "search") return AnalysisMode::Search;
    throw ParameterError("mode", 0.0, "Unknown analysis mode: " + name);
}

SearchStrategy parseStrategy(const std::string& name) {
    std::string key = toLower(name);
    if (key == "grid") return SearchStrategy::Grid;
    if (key == "random") return SearchStrategy::Random;
    if (key == "genetic") return SearchStrategy::Genetic;
    if (key == "hybrid") return SearchStrategy::Hybrid;
    throw ParameterError("search_strategy", 0.0, "Unknown search strategy: " + name);
}
