// src/calculators/limit_equilibrium/bishop_solver.cpp
#include "bishop_solver.h"
#include "../stability_core/stability_errors.h"
#include "../../utils/validation/input_validator.h"
#include <cmath>
#include <sstream>

BishopSolver::BishopSolver(const std::vector<Slice>& slices, const BishopOptions& options)
    : slices_(slices), arrays_(slices), options_(options) {
    InputValidator::validateBishopOptions(options_);
}

Eigen::ArrayXd BishopSolver::mAlpha(double fs) const {
    return arrays_.cosAlpha() + arrays_.sinAlpha() * arrays_.tanPhi() / fs;
}

AnalysisResult BishopSolver::solve(double initialFs) const {
    if (!std::isfinite(initialFs) || initialFs <= 0.0) {
        throw ParameterError("initial_fs", initialFs,
                             "Bishop iteration needs a positive, finite initial factor of safety");
    }

    double drivingSum = arrays_.checkedDrivingSum();

    // Numerator terms that do not depend on FS
    Eigen::ArrayXd effectiveWeight = (arrays_.weight() - arrays_.porePressure() * arrays_.width()).max(0.0);
    Eigen::ArrayXd shearCapacity = arrays_.cohesion() * arrays_.width() + effectiveWeight * arrays_.tanPhi();

    // Zero capacity gives FS = 0 whatever m_alpha is
    double capacitySum = shearCapacity.sum();
    if (!(capacitySum > 0.0) || !std::isfinite(capacitySum)) {
        std::ostringstream message;
        message << "No shear resistance along the slip surface (sum = " << capacitySum
                << " kN/m): pore pressure cancels the friction of a cohesionless soil";
        throw ParameterError("shear_resistance", capacitySum, message.str());
    }

    AnalysisResult result;
    result.method = AnalysisMethod::Bishop;
    result.fsHistory.push_back(initialFs);

    double fs = initialFs;
    double residual = 0.0;
    bool converged = false;

    for (int iter = 1; iter <= options_.maxIterations; ++iter) {
        Eigen::ArrayXd m = mAlpha(fs);

        Eigen::Index worst;
        double minM = m.minCoeff(&worst);
        if (minM <= 0.0) {
            std::ostringstream message;
            message << "m_alpha = " << minM << " at slice " << worst << " for FS = " << fs
                    << ": base too steep against the sliding direction";
            throw InvalidGeometryError(static_cast<int>(worst), minM, fs, message.str());
        }

        double fsNew = (shearCapacity / m).sum() / drivingSum;
        residual = std::abs(fsNew - fs);
        fs = fsNew;
        result.fsHistory.push_back(fs);
        result.iterations = iter;

        if (residual < options_.tolerance) {
            converged = true;
            break;
        }
    }

    if (!converged) {
        std::ostringstream message;
        message << "Bishop iteration did not converge in " << options_.maxIterations
                << " iterations (last FS = " << fs << ", residual = " << residual << ")";
        throw ConvergenceError(options_.maxIterations, fs, residual, message.str());
    }

    result.status = AnalysisStatus::Valid;
    result.factorOfSafety = fs;
    result.residual = residual;

    Eigen::ArrayXd finalM = mAlpha(fs);
    Eigen::ArrayXd resisting = shearCapacity / finalM;
    Eigen::ArrayXd driving = arrays_.drivingForces();

    result.slices.reserve(slices_.size());
    for (size_t i = 0; i < slices_.size(); ++i) {
        const Slice& slice = slices_[i];
        Eigen::Index k = static_cast<Eigen::Index>(i);

        SliceDiagnostic diagnostic;
        diagnostic.index = slice.index;
        diagnostic.xCenter = slice.xCenter;
        diagnostic.width = slice.width;
        diagnostic.height = slice.height;
        diagnostic.alphaDegrees = slice.alpha * 180.0 / M_PI;
        diagnostic.weight = slice.weight;
        diagnostic.porePressure = slice.porePressure;
        diagnostic.resistingForce = resisting(k);
        diagnostic.drivingForce = driving(k);
        diagnostic.mAlpha = finalM(k);
        diagnostic.inTension = arrays_.weight()(k) - arrays_.porePressure()(k) * arrays_.width()(k) < 0.0;
        result.slices.push_back(diagnostic);
    }

    return result;
}
