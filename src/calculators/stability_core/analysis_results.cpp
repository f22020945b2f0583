// src/calculators/stability_core/analysis_results.cpp
#include "analysis_results.h"
#include "../../utils/validation/result_validator.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

std::string statusName(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::Valid: return "Valid";
        case AnalysisStatus::ParameterError: return "Parameter error";
        case AnalysisStatus::GeometryError: return "Geometry error";
        case AnalysisStatus::InvalidSlipSurface: return "Invalid slip surface";
        case AnalysisStatus::InvalidGeometry: return "Invalid geometry";
        case AnalysisStatus::ConvergenceError: return "Convergence error";
    }
    return "Unknown";
}

void AnalysisResult::printSummary() const {
    std::cout << "======== " << methodName(method) << " ANALYSIS ========" << std::endl;
    if (circle) {
        std::cout << "Circle: center = (" << circle->xc << ", " << circle->yc
                  << ") m, radius = " << circle->radius << " m" << std::endl;
    }
    std::cout << "Status = " << statusName(status) << std::endl;
    if (!statusMessage.empty()) {
        std::cout << "Message: " << statusMessage << std::endl;
    }

    if (factorOfSafety) {
        std::cout << "Factor of Safety = " << std::fixed << std::setprecision(3)
                  << *factorOfSafety << std::defaultfloat << " ("
                  << ResultValidator::classifyFactorOfSafety(*factorOfSafety) << ")" << std::endl;
    } else {
        std::cout << "Factor of Safety = undefined" << std::endl;
    }

    if (method == AnalysisMethod::Bishop && iterations > 0) {
        std::cout << "Iterations = " << iterations << ", residual = " << residual << std::endl;
    }
    std::cout << "Slices = " << slices.size() << std::endl;

    for (const auto& warning : warnings) {
        std::cout << "Warning: " << warning << std::endl;
    }
}

void AnalysisResult::writeSlicesToFile(const std::string& directory) const {
    std::string suffix = methodName(method);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string filename = directory + "/slices_" + suffix + ".txt";

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open slice results file: " + filename);
    }

    file << "Index\tX_Center(m)\tWidth(m)\tHeight(m)\tAlpha(deg)\tWeight(kN/m)\t"
         << "Pore_Pressure(kPa)\tResisting(kN/m)\tDriving(kN/m)\tM_Alpha\tTension" << std::endl;
    for (const auto& slice : slices) {
        file << slice.index << "\t" << slice.xCenter << "\t" << slice.width << "\t"
             << slice.height << "\t" << slice.alphaDegrees << "\t" << slice.weight << "\t"
             << slice.porePressure << "\t" << slice.resistingForce << "\t" << slice.drivingForce << "\t";
        if (slice.mAlpha) {
            file << *slice.mAlpha;
        } else {
            file << "-";
        }
        file << "\t" << (slice.inTension ? 1 : 0) << std::endl;
    }
    file.close();
}
