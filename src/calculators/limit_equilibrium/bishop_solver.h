// src/calculators/limit_equilibrium/bishop_solver.h
#pragma once
#include "slice_arrays.h"
#include "../stability_core/analysis_options.h"
#include "../stability_core/analysis_results.h"
#include "../stability_core/slice.h"
#include <vector>

// Simplified Bishop method: moment equilibrium with horizontal interslice forces,
// solved by fixed-point iteration on FS
class BishopSolver {
public:
    BishopSolver(const std::vector<Slice>& slices, const BishopOptions& options = BishopOptions());

    // initialFs seeds the iteration, normally the Fellenius result.
    // Throws ParameterError, InvalidSlipSurfaceError, InvalidGeometryError or ConvergenceError.
    AnalysisResult solve(double initialFs) const;

private:
    // m_alpha = cos(alpha) + sin(alpha) tan(phi) / fs
    Eigen::ArrayXd mAlpha(double fs) const;

    std::vector<Slice> slices_;
    SliceArrays arrays_;
    BishopOptions options_;
};
