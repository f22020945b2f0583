// src/calculators/limit_equilibrium/fellenius_solver.h
#pragma once
#include "slice_arrays.h"
#include "../stability_core/analysis_results.h"
#include "../stability_core/slice.h"
#include <vector>

// Ordinary method of slices: closed form, no interslice forces
class FelleniusSolver {
public:
    explicit FelleniusSolver(const std::vector<Slice>& slices);

    // Throws InvalidSlipSurfaceError when sum(W sin alpha) <= 0, ParameterError when no slice resists
    AnalysisResult solve() const;

private:
    std::vector<Slice> slices_;
    SliceArrays arrays_;
};
