// src/calculators/stability_core/slope_analyzer.cpp
#include "slope_analyzer.h"
#include "stability_errors.h"
#include "../limit_equilibrium/bishop_solver.h"
#include "../limit_equilibrium/fellenius_solver.h"
#include "../../utils/validation/input_validator.h"
#include "../../utils/validation/result_validator.h"
#include <iostream>

namespace {

// Bishop start value when Fellenius gives no usable FS
const double DEFAULT_BISHOP_SEED = 1.0;

AnalysisResult failedResult(AnalysisMethod method, AnalysisStatus status, const std::string& message,
                            const FailureCircle& circle, const std::vector<std::string>& warnings) {
    AnalysisResult result;
    result.method = method;
    result.status = status;
    result.statusMessage = message;
    result.circle = circle;
    result.warnings = warnings;
    return result;
}

}

SlopeAnalyzer::SlopeAnalyzer(const TerrainProfile& terrain,
                             const SoilProfile& soil,
                             const std::optional<WaterTable>& waterTable,
                             const AnalysisProperties& properties)
    : terrain_(terrain),
      soil_(soil),
      waterTable_(waterTable),
      properties_(properties),
      discretizer_(terrain, soil, waterTable, properties.sliceOptions) {
    InputValidator::validateBishopOptions(properties_.bishopOptions);
}

std::vector<AnalysisResult> SlopeAnalyzer::analyzeCircle(const FailureCircle& circle) const {
    bool withFellenius = properties_.method != AnalysisMethod::Bishop;
    bool withBishop = properties_.method != AnalysisMethod::Fellenius;
    return analyze(circle, withFellenius, withBishop);
}

AnalysisResult SlopeAnalyzer::analyzeCircle(const FailureCircle& circle, AnalysisMethod method) const {
    if (method == AnalysisMethod::Both) {
        throw ParameterError("method", 0.0, "Single-method analysis needs Fellenius or Bishop");
    }
    return analyze(circle, method == AnalysisMethod::Fellenius, method == AnalysisMethod::Bishop).front();
}

std::vector<AnalysisResult> SlopeAnalyzer::runManual() const {
    if (!properties_.circle) {
        throw ParameterError("circle", 0.0, "Manual mode needs circle_xc, circle_yc and circle_radius");
    }
    return analyzeCircle(*properties_.circle);
}

std::vector<AnalysisResult> SlopeAnalyzer::analyze(const FailureCircle& circle,
                                                   bool withFellenius, bool withBishop) const {
    InputValidator::validateCircle(circle);
    std::vector<std::string> warnings = geometryWarnings(circle);

    std::vector<AnalysisMethod> methods;
    if (withFellenius) methods.push_back(AnalysisMethod::Fellenius);
    if (withBishop) methods.push_back(AnalysisMethod::Bishop);

    auto failAll = [&](AnalysisStatus status, const std::string& message) {
        std::vector<AnalysisResult> results;
        for (AnalysisMethod method : methods) {
            results.push_back(failedResult(method, status, message, circle, warnings));
        }
        return results;
    };

    // Step 1: Slices
    std::vector<Slice> slices;
    try {
        slices = discretizer_.discretize(circle);
    } catch (const GeometryError& e) {
        return failAll(AnalysisStatus::GeometryError, e.what());
    }

    // Step 2: Fellenius, also the seed for Bishop
    AnalysisResult fellenius;
    try {
        fellenius = FelleniusSolver(slices).solve();
        fellenius.circle = circle;
        fellenius.warnings = warnings;
        for (const auto& warning : ResultValidator::checkFactorOfSafety(*fellenius.factorOfSafety)) {
            fellenius.warnings.push_back(warning);
        }
    } catch (const InvalidSlipSurfaceError& e) {
        return failAll(AnalysisStatus::InvalidSlipSurface, e.what());
    } catch (const ParameterError& e) {
        fellenius = failedResult(AnalysisMethod::Fellenius, AnalysisStatus::ParameterError,
                                 e.what(), circle, warnings);
    }

    std::vector<AnalysisResult> results;
    if (withFellenius) {
        results.push_back(fellenius);
    }
    if (!withBishop) {
        return results;
    }

    // Step 3: Bishop
    AnalysisResult bishop;
    try {
        double seed = fellenius.isValid() ? *fellenius.factorOfSafety : DEFAULT_BISHOP_SEED;
        bishop = BishopSolver(slices, properties_.bishopOptions).solve(seed);
    } catch (const ParameterError& e) {
        results.push_back(failedResult(AnalysisMethod::Bishop, AnalysisStatus::ParameterError,
                                       e.what(), circle, warnings));
        return results;
    } catch (const InvalidGeometryError& e) {
        results.push_back(failedResult(AnalysisMethod::Bishop, AnalysisStatus::InvalidGeometry,
                                       e.what(), circle, warnings));
        return results;
    } catch (const ConvergenceError& e) {
        if (properties_.verbose) {
            std::cout << "Warning: " << e.what() << std::endl;
        }
        AnalysisResult failed = failedResult(AnalysisMethod::Bishop, AnalysisStatus::ConvergenceError,
                                             e.what(), circle, warnings);
        failed.iterations = e.iterations();
        failed.residual = e.residual();
        results.push_back(failed);
        return results;
    }

    bishop.circle = circle;
    bishop.warnings = warnings;
    for (const auto& warning : ResultValidator::checkFactorOfSafety(*bishop.factorOfSafety)) {
        bishop.warnings.push_back(warning);
    }

    if (fellenius.isValid()) {
        MethodAgreement agreement = ResultValidator::compareMethods(*fellenius.factorOfSafety,
                                                                    *bishop.factorOfSafety);
        if (!agreement.withinTypicalSpread) {
            bishop.warnings.push_back(agreement.message);
        }
    }

    results.push_back(bishop);
    return results;
}

std::vector<std::string> SlopeAnalyzer::geometryWarnings(const FailureCircle& circle) const {
    std::vector<std::string> warnings;

    if (terrain_.slopeGeometry().height > 0.0) {
        CircleValidation validation =
            CircleConstraintCalculator::validateAndCorrect(circle, searchBounds(), false);
        if (!validation.isValid) {
            std::string message = "Circle outside the recommended search bounds:";
            for (size_t i = 0; i < validation.violations.size(); ++i) {
                message += (i == 0 ? " " : ", ") + violationName(validation.violations[i]);
            }
            warnings.push_back(message);
        }
    }

    if (!CircleConstraintCalculator::exitsGround(circle, terrain_)) {
        warnings.push_back("Slip arc does not emerge at the ground surface on both sides");
    }
    return warnings;
}

std::optional<ConstraintFactors> SlopeAnalyzer::constraintFactors() const {
    const AnalysisProperties& p = properties_;
    if (!p.lateralMarginFactor && !p.centerHeightMinFactor && !p.centerHeightMaxFactor &&
        !p.radiusMinFactor && !p.radiusMaxFactor) {
        return std::nullopt;
    }

    ConstraintFactors factors = CircleConstraintCalculator::presetFactors(
        CircleConstraintCalculator::classifySlope(terrain_.slopeGeometry().faceAngle));
    if (p.lateralMarginFactor) factors.lateralMargin = *p.lateralMarginFactor;
    if (p.centerHeightMinFactor) factors.centerHeightMin = *p.centerHeightMinFactor;
    if (p.centerHeightMaxFactor) factors.centerHeightMax = *p.centerHeightMaxFactor;
    if (p.radiusMinFactor) factors.radiusMin = *p.radiusMinFactor;
    if (p.radiusMaxFactor) factors.radiusMax = *p.radiusMaxFactor;
    return factors;
}

SearchBounds SlopeAnalyzer::searchBounds() const {
    return CircleConstraintCalculator::calculateBounds(terrain_, constraintFactors());
}

SearchConfig SlopeAnalyzer::buildSearchConfig() const {
    const AnalysisProperties& p = properties_;
    SearchConfig config;
    config.strategy = p.searchStrategy;
    config.method = (p.method == AnalysisMethod::Fellenius) ? AnalysisMethod::Fellenius : AnalysisMethod::Bishop;
    config.sliceOptions = p.sliceOptions;
    config.bishopOptions = p.bishopOptions;
    config.gridPoints = p.gridPoints;
    config.refinePoints = p.refinePoints;
    config.refinePasses = p.refinePasses;
    config.randomSamples = p.randomSamples;
    config.populationSize = p.populationSize;
    config.generations = p.generations;
    config.mutationRate = p.mutationRate;
    config.mutationScale = p.mutationScale;
    config.crossoverRate = p.crossoverRate;
    config.tournamentSize = p.tournamentSize;
    config.randomSeed = p.randomSeed;
    config.requireGroundExit = p.requireGroundExit;
    config.verbose = p.verbose;
    if (p.circle) {
        config.hintCircles.push_back(*p.circle);
    }
    return config;
}

SearchResult SlopeAnalyzer::runSearch() const {
    return runSearch(buildSearchConfig());
}

SearchResult SlopeAnalyzer::runSearch(const SearchConfig& config) const {
    SearchBounds bounds = searchBounds();
    if (config.verbose) {
        std::cout << "Search bounds computed for a " << bounds.geometry.height << " m high, "
                  << bounds.geometry.faceAngle << " deg slope ("
                  << slopeClassName(CircleConstraintCalculator::classifySlope(bounds.geometry.faceAngle))
                  << ")" << std::endl;
    }

    CriticalCircleSearch search(terrain_, soil_, waterTable_, bounds, config);
    return search.run();
}
