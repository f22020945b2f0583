// src/utils/validation/result_validator.h
#pragma once
#include <string>
#include <vector>

struct MethodAgreement {
    double ratio;                 // Bishop / Fellenius
    double relativeDifference;    // (Bishop - Fellenius) / Fellenius
    bool withinTypicalSpread;
    std::string message;
};

// Plausibility checks on computed factors of safety
class ResultValidator {
public:
    // Typical spread of Bishop above Fellenius for the same circle
    static constexpr double LOWER_MARGIN = -0.02;
    static constexpr double UPPER_MARGIN = 0.20;
    static constexpr double SUSPICIOUS_FS = 10.0;

    // "unstable", "marginal", "stable" or "very stable"
    static std::string classifyFactorOfSafety(double factorOfSafety);

    static MethodAgreement compareMethods(double felleniusFs, double bishopFs);

    // Warnings for values that are computable but physically doubtful
    static std::vector<std::string> checkFactorOfSafety(double factorOfSafety);
};
