// src/calculators/stability_core/analysis_results.h
#pragma once
#include "analysis_options.h"
#include "failure_circle.h"
#include <optional>
#include <string>
#include <vector>

enum class AnalysisStatus {
    Valid,
    ParameterError,
    GeometryError,
    InvalidSlipSurface,
    InvalidGeometry,
    ConvergenceError
};

std::string statusName(AnalysisStatus status);

struct SliceDiagnostic {
    int index;
    double xCenter;          // m
    double width;            // m
    double height;           // m
    double alphaDegrees;     // Base inclination (degrees)
    double weight;           // kN/m
    double porePressure;     // kPa
    double resistingForce;   // Numerator term of the method (kN/m)
    double drivingForce;     // W sin(alpha) (kN/m)
    std::optional<double> mAlpha;  // Bishop only
    bool inTension;          // Effective normal term clipped at zero
};

class AnalysisResult {
public:
    AnalysisMethod method = AnalysisMethod::Bishop;
    AnalysisStatus status = AnalysisStatus::Valid;
    std::optional<double> factorOfSafety;   // Absent when the analysis failed

    // Bishop iteration data
    int iterations = 0;
    double residual = 0.0;
    std::vector<double> fsHistory;

    std::optional<FailureCircle> circle;
    std::vector<SliceDiagnostic> slices;

    std::string statusMessage;
    std::vector<std::string> warnings;

    bool isValid() const { return status == AnalysisStatus::Valid && factorOfSafety.has_value(); }

    // Output summary to console
    void printSummary() const;

    // Write per-slice diagnostics to <directory>/slices_<method>.txt
    void writeSlicesToFile(const std::string& directory) const;
};
