// src/calculators/stability_core/circle_search.cpp
#include "circle_search.h"
#include "circle_constraints.h"
#include "stability_errors.h"
#include "../limit_equilibrium/bishop_solver.h"
#include "../limit_equilibrium/fellenius_solver.h"
#include "../../utils/validation/input_validator.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace {

const double PENALTY_FITNESS = 0.0;
const int RANDOM_BATCH_SIZE = 64;

}

std::string searchStatusName(SearchStatus status) {
    switch (status) {
        case SearchStatus::Found: return "Found";
        case SearchStatus::NoValidCircle: return "No valid circle";
        case SearchStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

void SearchResult::printSummary() const {
    std::cout << "======== CRITICAL CIRCLE SEARCH ========" << std::endl;
    std::cout << "Strategy = " << strategyName(strategy) << ", method = " << methodName(method) << std::endl;
    std::cout << "Status = " << searchStatusName(status) << std::endl;
    if (!message.empty()) {
        std::cout << "Message: " << message << std::endl;
    }
    std::cout << "Candidates evaluated = " << evaluatedCandidates
              << ", valid = " << validCandidates
              << ", iterations = " << iterations << std::endl;

    if (bestCircle && factorOfSafety) {
        std::cout << "Critical circle: center = (" << bestCircle->xc << ", " << bestCircle->yc
                  << ") m, radius = " << bestCircle->radius << " m" << std::endl;
        std::cout << "Minimum Factor of Safety = " << std::fixed << std::setprecision(3)
                  << *factorOfSafety << std::defaultfloat << std::endl;
    }
}

void SearchResult::writeHistoryToFile(const std::string& directory) const {
    std::string filename = directory + "/search_history.txt";
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open search history file: " + filename);
    }

    file << "Batch\tBest_FS(-)" << std::endl;
    for (size_t i = 0; i < bestHistory.size(); ++i) {
        file << i + 1 << "\t" << bestHistory[i] << std::endl;
    }
    file.close();
}

CriticalCircleSearch::CriticalCircleSearch(const TerrainProfile& terrain,
                                           const SoilProfile& soil,
                                           const std::optional<WaterTable>& waterTable,
                                           const SearchBounds& bounds,
                                           const SearchConfig& config)
    : discretizer_(terrain, soil, waterTable, config.sliceOptions),
      terrain_(terrain),
      bounds_(bounds),
      config_(config),
      evaluated_(0),
      valid_(0),
      iterations_(0),
      rng_(config.randomSeed) {
    InputValidator::validateSearchConfig(config_);
    InputValidator::validateSearchBounds(bounds_);
    if (config_.method == AnalysisMethod::Both) {
        config_.method = AnalysisMethod::Bishop;
    }
}

SearchResult CriticalCircleSearch::run() {
    best_.reset();
    evaluated_ = 0;
    valid_ = 0;
    iterations_ = 0;
    history_.clear();
    rng_.seed(config_.randomSeed);

    if (config_.verbose) {
        std::cout << "Starting " << strategyName(config_.strategy) << " circle search ("
                  << methodName(config_.method) << ")..." << std::endl;
        std::cout << "  Center x: [" << bounds_.centerXMin << ", " << bounds_.centerXMax << "] m" << std::endl;
        std::cout << "  Center y: [" << bounds_.centerYMin << ", " << bounds_.centerYMax << "] m" << std::endl;
        std::cout << "  Radius:   [" << bounds_.radiusMin << ", " << bounds_.radiusMax << "] m" << std::endl;
    }

    if (!config_.hintCircles.empty()) {
        std::vector<FailureCircle> hints;
        for (const auto& hint : config_.hintCircles) {
            hints.push_back(*CircleConstraintCalculator::validateAndCorrect(hint, bounds_, true).correctedCircle);
        }
        evaluateBatch(hints, "hints");
    }

    switch (config_.strategy) {
        case SearchStrategy::Grid:
            runGrid();
            break;
        case SearchStrategy::Random:
            runRandom();
            break;
        case SearchStrategy::Genetic:
            runGenetic();
            break;
        case SearchStrategy::Hybrid:
            runGrid();
            runGenetic();
            runPatternSearch();
            break;
    }

    SearchResult result;
    result.strategy = config_.strategy;
    result.method = config_.method;
    result.evaluatedCandidates = evaluated_;
    result.validCandidates = valid_;
    result.iterations = iterations_;
    result.bestHistory = history_;

    if (best_) {
        result.bestCircle = best_->circle;
        result.factorOfSafety = best_->factorOfSafety;
        result.bestAnalysis = analyzeBest(best_->circle);
    }

    if (cancelled()) {
        result.status = SearchStatus::Cancelled;
        result.message = "Search cancelled after " + std::to_string(evaluated_) + " candidates";
    } else if (best_) {
        result.status = SearchStatus::Found;
    } else {
        result.status = SearchStatus::NoValidCircle;
        result.message = "None of the " + std::to_string(evaluated_) +
                         " candidates produced a valid slip surface";
    }

    if (config_.verbose) {
        std::cout << "Circle search finished: " << searchStatusName(result.status) << ", "
                  << valid_ << "/" << evaluated_ << " valid candidates." << std::endl;
    }

    return result;
}

std::optional<double> CriticalCircleSearch::evaluate(const FailureCircle& circle) const {
    if (config_.requireGroundExit && !CircleConstraintCalculator::exitsGround(circle, terrain_)) {
        return std::nullopt;
    }

    double fs = 0.0;
    try {
        std::vector<Slice> slices = discretizer_.discretize(circle);
        AnalysisResult fellenius = FelleniusSolver(slices).solve();
        fs = *fellenius.factorOfSafety;
        if (config_.method == AnalysisMethod::Bishop) {
            AnalysisResult bishop = BishopSolver(slices, config_.bishopOptions).solve(fs);
            fs = *bishop.factorOfSafety;
        }
    } catch (const StabilityError&) {
        return std::nullopt;
    }

    if (!std::isfinite(fs) || fs <= 0.0) {
        return std::nullopt;
    }
    return fs;
}

std::vector<CriticalCircleSearch::Candidate> CriticalCircleSearch::evaluateBatch(
    const std::vector<FailureCircle>& circles, const std::string& phase) {
    const int n = static_cast<int>(circles.size());
    std::vector<Candidate> results(circles.size());

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        results[i].circle = circles[i];
        if (cancelled()) {
            results[i].evaluated = false;
            continue;
        }
        results[i].factorOfSafety = evaluate(circles[i]);
        results[i].evaluated = true;
    }

    // Reduction in input order keeps the result independent of the thread count
    for (const auto& candidate : results) {
        if (!candidate.evaluated) {
            continue;
        }
        evaluated_++;
        if (!candidate.factorOfSafety) {
            continue;
        }
        valid_++;
        if (!best_ || *candidate.factorOfSafety < *best_->factorOfSafety) {
            best_ = candidate;
        }
    }

    std::optional<double> bestFs;
    if (best_) {
        bestFs = best_->factorOfSafety;
        history_.push_back(*bestFs);
    }

    if (config_.progressCallback) {
        config_.progressCallback({phase, evaluated_, valid_, bestFs});
    }

    return results;
}

void CriticalCircleSearch::runGrid() {
    Eigen::Vector3d lower = lowerCorner();
    Eigen::Vector3d upper = upperCorner();
    Eigen::Vector3d span = upper - lower;
    const int n = config_.gridPoints;

    if (config_.verbose) {
        std::cout << "Step 1: Coarse grid (" << n * n * n << " candidates)..." << std::endl;
    }
    evaluateBatch(gridAround(0.5 * (lower + upper), 0.5 * span, n), "grid");
    iterations_++;

    if (!best_) {
        if (config_.verbose) {
            std::cout << "Warning: No valid circle on the coarse grid, skipping refinement" << std::endl;
        }
        return;
    }

    // First window spans one coarse cell on each side of the best point
    Eigen::Vector3d halfSpan = span / static_cast<double>(n - 1);
    for (int pass = 0; pass < config_.refinePasses; ++pass) {
        if (cancelled()) {
            return;
        }
        if (config_.verbose) {
            std::cout << "  Refinement pass " << pass + 1 << ", best FS so far: "
                      << *best_->factorOfSafety << std::endl;
        }
        evaluateBatch(gridAround(toVector(best_->circle), halfSpan, config_.refinePoints), "grid");
        iterations_++;
        halfSpan *= config_.refineFactor;
    }
}

void CriticalCircleSearch::runRandom() {
    if (config_.verbose) {
        std::cout << "Step 1: Random sampling (" << config_.randomSamples << " candidates)..." << std::endl;
    }

    std::vector<FailureCircle> samples = CircleConstraintCalculator::generateCircles(
        bounds_, config_.randomSamples, SamplingDistribution::Uniform,
        static_cast<unsigned int>(rng_()));

    for (size_t start = 0; start < samples.size(); start += RANDOM_BATCH_SIZE) {
        if (cancelled()) {
            return;
        }
        size_t end = std::min(samples.size(), start + RANDOM_BATCH_SIZE);
        evaluateBatch(std::vector<FailureCircle>(samples.begin() + start, samples.begin() + end), "random");
    }
    iterations_++;
}

void CriticalCircleSearch::runGenetic() {
    Eigen::Vector3d lower = lowerCorner();
    Eigen::Vector3d upper = upperCorner();
    Eigen::Vector3d span = upper - lower;
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    if (config_.verbose) {
        std::cout << "Step 2: Genetic search (" << config_.populationSize << " x "
                  << config_.generations << ")..." << std::endl;
    }

    // Initial population: best circle so far, hints, then uniform samples
    std::vector<Eigen::Vector3d> population;
    if (best_) {
        population.push_back(toVector(best_->circle));
    }
    for (const auto& hint : config_.hintCircles) {
        if (static_cast<int>(population.size()) >= config_.populationSize) {
            break;
        }
        population.push_back(clampToBounds(toVector(hint)));
    }
    while (static_cast<int>(population.size()) < config_.populationSize) {
        Eigen::Vector3d individual;
        for (int k = 0; k < 3; ++k) {
            individual(k) = lower(k) + unit(rng_) * span(k);
        }
        population.push_back(individual);
    }

    for (int generation = 0; generation < config_.generations; ++generation) {
        if (cancelled()) {
            return;
        }

        std::vector<FailureCircle> circles;
        circles.reserve(population.size());
        for (const auto& individual : population) {
            circles.push_back(toCircle(individual));
        }
        std::vector<Candidate> evaluatedPopulation = evaluateBatch(circles, "genetic");
        iterations_++;

        std::vector<double> fitness(population.size(), PENALTY_FITNESS);
        for (size_t i = 0; i < evaluatedPopulation.size(); ++i) {
            if (evaluatedPopulation[i].factorOfSafety) {
                fitness[i] = 1.0 / *evaluatedPopulation[i].factorOfSafety;
            }
        }

        std::uniform_int_distribution<size_t> pick(0, population.size() - 1);
        auto tournament = [&]() -> const Eigen::Vector3d& {
            size_t winner = pick(rng_);
            for (int t = 1; t < config_.tournamentSize; ++t) {
                size_t challenger = pick(rng_);
                if (fitness[challenger] > fitness[winner]) {
                    winner = challenger;
                }
            }
            return population[winner];
        };

        std::vector<Eigen::Vector3d> next;
        next.reserve(population.size());
        if (best_) {
            next.push_back(toVector(best_->circle));
        }

        while (next.size() < population.size()) {
            Eigen::Vector3d child = tournament();
            if (unit(rng_) < config_.crossoverRate) {
                const Eigen::Vector3d& other = tournament();
                double w = unit(rng_);
                child = w * child + (1.0 - w) * other;
            }
            for (int k = 0; k < 3; ++k) {
                if (unit(rng_) < config_.mutationRate) {
                    child(k) += (2.0 * unit(rng_) - 1.0) * config_.mutationScale * span(k);
                }
            }
            next.push_back(clampToBounds(child));
        }

        population.swap(next);
    }
}

void CriticalCircleSearch::runPatternSearch() {
    if (!best_) {
        return;
    }

    if (config_.verbose) {
        std::cout << "Step 3: Local pattern search from FS = " << *best_->factorOfSafety << "..." << std::endl;
    }

    Eigen::Vector3d span = upperCorner() - lowerCorner();
    Eigen::Vector3d step = 0.1 * span;
    Eigen::Vector3d minStep = 1e-3 * span;

    for (int iter = 0; iter < config_.patternIterations; ++iter) {
        if (cancelled()) {
            return;
        }

        Eigen::Vector3d origin = toVector(best_->circle);
        double originFs = *best_->factorOfSafety;

        std::vector<FailureCircle> probes;
        for (int k = 0; k < 3; ++k) {
            for (double sign : {1.0, -1.0}) {
                Eigen::Vector3d probe = origin;
                probe(k) += sign * step(k);
                probes.push_back(toCircle(clampToBounds(probe)));
            }
        }

        evaluateBatch(probes, "pattern");
        iterations_++;

        if (!(*best_->factorOfSafety < originFs)) {
            step *= 0.5;
            if ((step.array() < minStep.array()).all()) {
                break;
            }
        }
    }
}

std::vector<FailureCircle> CriticalCircleSearch::gridAround(const Eigen::Vector3d& center,
                                                            const Eigen::Vector3d& halfSpan,
                                                            int pointsPerAxis) const {
    Eigen::Vector3d lower = clampToBounds(center - halfSpan);
    Eigen::Vector3d upper = clampToBounds(center + halfSpan);

    Eigen::VectorXd xs = Eigen::VectorXd::LinSpaced(pointsPerAxis, lower(0), upper(0));
    Eigen::VectorXd ys = Eigen::VectorXd::LinSpaced(pointsPerAxis, lower(1), upper(1));
    Eigen::VectorXd rs = Eigen::VectorXd::LinSpaced(pointsPerAxis, lower(2), upper(2));

    std::vector<FailureCircle> circles;
    circles.reserve(static_cast<size_t>(pointsPerAxis * pointsPerAxis * pointsPerAxis));
    for (Eigen::Index i = 0; i < xs.size(); ++i) {
        for (Eigen::Index j = 0; j < ys.size(); ++j) {
            for (Eigen::Index k = 0; k < rs.size(); ++k) {
                circles.push_back({xs(i), ys(j), rs(k)});
            }
        }
    }
    return circles;
}

Eigen::Vector3d CriticalCircleSearch::lowerCorner() const {
    return Eigen::Vector3d(bounds_.centerXMin, bounds_.centerYMin, bounds_.radiusMin);
}

Eigen::Vector3d CriticalCircleSearch::upperCorner() const {
    return Eigen::Vector3d(bounds_.centerXMax, bounds_.centerYMax, bounds_.radiusMax);
}

Eigen::Vector3d CriticalCircleSearch::clampToBounds(const Eigen::Vector3d& v) const {
    return v.cwiseMax(lowerCorner()).cwiseMin(upperCorner());
}

Eigen::Vector3d CriticalCircleSearch::toVector(const FailureCircle& circle) {
    return Eigen::Vector3d(circle.xc, circle.yc, circle.radius);
}

FailureCircle CriticalCircleSearch::toCircle(const Eigen::Vector3d& v) {
    return {v(0), v(1), v(2)};
}

bool CriticalCircleSearch::cancelled() const {
    return config_.cancelFlag != nullptr && config_.cancelFlag->load();
}

AnalysisResult CriticalCircleSearch::analyzeBest(const FailureCircle& circle) const {
    std::vector<Slice> slices = discretizer_.discretize(circle);
    AnalysisResult result = FelleniusSolver(slices).solve();
    if (config_.method == AnalysisMethod::Bishop) {
        result = BishopSolver(slices, config_.bishopOptions).solve(*result.factorOfSafety);
    }
    result.circle = circle;
    return result;
}
