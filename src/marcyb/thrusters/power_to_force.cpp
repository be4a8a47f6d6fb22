#include "marcyb/thrusters/power_to_force.hpp"
#include <cmath>
#include <stdexcept>

namespace marcyb {
namespace thrusters {

static constexpr double kGrav = 9.81;           // m/s^2
static constexpr double kHpPerKw = 1.36332;     // metric horsepower per kW

std::pair<double, double> imcaPowerToForce(ThrusterType type, double max_power_positive,
                                           double max_power_negative) {
    if (max_power_positive < 0.0 || max_power_negative < 0.0) {
        throw std::invalid_argument("imcaPowerToForce: powers must be non-negative");
    }

    // kgf per hp, converted to kN per kW
    const double kn_per_kw = 1e-3 * kHpPerKw * kGrav;

    double factor_positive = 0.0;
    double factor_negative = 0.0;
    switch (type) {
        case ThrusterType::TUNNEL:
            factor_positive = 11.0 * kn_per_kw;
            factor_negative = -11.0 * kn_per_kw;
            break;
        case ThrusterType::AZIMUTH:
            factor_positive = 13.0 * kn_per_kw;
            factor_negative = -8.0 * kn_per_kw;
            break;
        case ThrusterType::PROPELLER:
            factor_positive = 13.0 * kn_per_kw;
            factor_negative = -0.7 * factor_positive;
            break;
        case ThrusterType::WATERJET:
            factor_positive = 8.0 * kn_per_kw;
            factor_negative = 0.0;
            break;
        default:
            throw std::invalid_argument("imcaPowerToForce: illegal thruster type");
    }

    return {factor_positive * max_power_positive, factor_negative * max_power_negative};
}

double absInlineTandemReduction(double x, double diameter) {
    if (!(diameter > 0.0) || x < 0.0) {
        throw std::invalid_argument("absInlineTandemReduction: need x >= 0 and diameter > 0");
    }
    return 1.0 - std::pow(0.75, std::pow(x / diameter, 2.0 / 3.0));
}

double absCoandaReduction() {
    return 0.97;
}

} // namespace thrusters
} // namespace marcyb
