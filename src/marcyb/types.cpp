#include "marcyb/types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace marcyb {

void WindForceOptions::validate() const {
    if (!std::isfinite(temperature)) {
        throw std::invalid_argument("WindForceOptions: temperature must be finite");
    }
    if (!std::isfinite(vessel_heading)) {
        throw std::invalid_argument("WindForceOptions: vessel_heading must be finite");
    }
    if (!std::isfinite(vessel_speed_surge) || !std::isfinite(vessel_speed_sway)) {
        throw std::invalid_argument("WindForceOptions: vessel speeds must be finite");
    }
}

CoefficientModel coefficientModelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "blendermann") return CoefficientModel::BLENDERMANN;
    if (lower == "isherwood") return CoefficientModel::ISHERWOOD;
    throw std::invalid_argument("Unknown coefficient model: '" + name + "'");
}

std::string toString(CoefficientModel model) {
    switch (model) {
        case CoefficientModel::BLENDERMANN:
            return "blendermann";
        case CoefficientModel::ISHERWOOD:
            return "isherwood";
    }
    return "unknown";
}

} // namespace marcyb
