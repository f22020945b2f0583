// src/utils/validation/result_validator.cpp
#include "result_validator.h"
#include <sstream>

std::string ResultValidator::classifyFactorOfSafety(double factorOfSafety) {
    if (factorOfSafety < 1.0) return "unstable";
    if (factorOfSafety < 1.2) return "marginal";
    if (factorOfSafety < 1.5) return "stable";
    return "very stable";
}

MethodAgreement ResultValidator::compareMethods(double felleniusFs, double bishopFs) {
    MethodAgreement agreement;
    agreement.ratio = bishopFs / felleniusFs;
    agreement.relativeDifference = agreement.ratio - 1.0;
    agreement.withinTypicalSpread = agreement.relativeDifference >= LOWER_MARGIN &&
                                    agreement.relativeDifference <= UPPER_MARGIN;

    std::ostringstream message;
    message << "Bishop/Fellenius = " << agreement.ratio << " ("
            << agreement.relativeDifference * 100.0 << "%)";
    if (!agreement.withinTypicalSpread) {
        message << ", outside the usual " << LOWER_MARGIN * 100.0 << "%.." << UPPER_MARGIN * 100.0
                << "% spread";
    }
    agreement.message = message.str();
    return agreement;
}

std::vector<std::string> ResultValidator::checkFactorOfSafety(double factorOfSafety) {
    std::vector<std::string> warnings;
    if (factorOfSafety > SUSPICIOUS_FS) {
        std::ostringstream message;
        message << "FS = " << factorOfSafety << " is suspiciously high; check that the circle cuts the slope";
        warnings.push_back(message.str());
    }
    if (factorOfSafety < 1.0) {
        std::ostringstream message;
        message << "FS = " << factorOfSafety << " < 1.0: slope is unstable on this surface";
        warnings.push_back(message.str());
    }
    return warnings;
}
