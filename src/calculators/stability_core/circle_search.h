// src/calculators/stability_core/circle_search.h
#pragma once
#include "analysis_options.h"
#include "analysis_results.h"
#include "failure_circle.h"
#include "slice_discretizer.h"
#include "soil_layer.h"
#include "terrain_profile.h"
#include <Eigen/Dense>
#include <atomic>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct SearchProgress {
    std::string phase;                          // "grid", "random", "genetic", "pattern"
    int evaluatedCandidates;
    int validCandidates;
    std::optional<double> bestFactorOfSafety;
};

struct SearchConfig {
    SearchStrategy strategy = SearchStrategy::Hybrid;
    AnalysisMethod method = AnalysisMethod::Bishop;   // Both is searched with Bishop
    SliceOptions sliceOptions;
    BishopOptions bishopOptions;

    // Grid
    int gridPoints = 8;          // Coarse points per axis
    int refinePoints = 5;        // Points per axis in each refinement window
    int refinePasses = 2;
    double refineFactor = 0.5;   // Window shrink per pass

    // Random
    int randomSamples = 300;

    // Genetic
    int populationSize = 30;
    int generations = 25;
    double mutationRate = 0.2;
    double mutationScale = 0.1;  // Fraction of each parameter range
    double crossoverRate = 0.8;
    int tournamentSize = 3;

    // Pattern search
    int patternIterations = 40;

    unsigned int randomSeed = 42;
    bool requireGroundExit = true;
    bool verbose = false;

    // Optional seeds, evaluated before the strategy runs
    std::vector<FailureCircle> hintCircles;

    std::function<void(const SearchProgress&)> progressCallback;
    const std::atomic<bool>* cancelFlag = nullptr;
};

enum class SearchStatus {
    Found,
    NoValidCircle,
    Cancelled
};

std::string searchStatusName(SearchStatus status);

class SearchResult {
public:
    SearchStatus status = SearchStatus::NoValidCircle;
    SearchStrategy strategy = SearchStrategy::Hybrid;
    AnalysisMethod method = AnalysisMethod::Bishop;

    std::optional<FailureCircle> bestCircle;
    std::optional<double> factorOfSafety;
    std::optional<AnalysisResult> bestAnalysis;   // Full analysis of the best circle

    int evaluatedCandidates = 0;
    int validCandidates = 0;
    int iterations = 0;                  // Grid passes, generations and pattern steps
    std::vector<double> bestHistory;     // Best FS after each batch
    std::string message;

    // Output summary to console
    void printSummary() const;

    // Write best FS history to <directory>/search_history.txt
    void writeHistoryToFile(const std::string& directory) const;
};

// Minimizes FS over the circles inside a SearchBounds box
class CriticalCircleSearch {
public:
    CriticalCircleSearch(const TerrainProfile& terrain,
                         const SoilProfile& soil,
                         const std::optional<WaterTable>& waterTable,
                         const SearchBounds& bounds,
                         const SearchConfig& config);

    SearchResult run();

    // FS of a single candidate, absent when it is rejected
    std::optional<double> evaluate(const FailureCircle& circle) const;

private:
    struct Candidate {
        FailureCircle circle;
        std::optional<double> factorOfSafety;
        bool evaluated;
    };

    // Strategy phases
    void runGrid();
    void runRandom();
    void runGenetic();
    void runPatternSearch();

    // Evaluates the batch across threads, then folds it into the best-so-far in input order
    std::vector<Candidate> evaluateBatch(const std::vector<FailureCircle>& circles, const std::string& phase);

    std::vector<FailureCircle> gridAround(const Eigen::Vector3d& center,
                                          const Eigen::Vector3d& halfSpan,
                                          int pointsPerAxis) const;

    Eigen::Vector3d lowerCorner() const;
    Eigen::Vector3d upperCorner() const;
    Eigen::Vector3d clampToBounds(const Eigen::Vector3d& v) const;
    static Eigen::Vector3d toVector(const FailureCircle& circle);
    static FailureCircle toCircle(const Eigen::Vector3d& v);

    bool cancelled() const;
    AnalysisResult analyzeBest(const FailureCircle& circle) const;

    SliceDiscretizer discretizer_;
    TerrainProfile terrain_;
    SearchBounds bounds_;
    SearchConfig config_;

    // Per-run state
    std::optional<Candidate> best_;
    int evaluated_;
    int valid_;
    int iterations_;
    std::vector<double> history_;
    std::mt19937_64 rng_;
};
