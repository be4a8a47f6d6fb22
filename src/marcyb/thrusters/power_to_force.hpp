#pragma once

#include <utility>

namespace marcyb {
namespace thrusters {

enum class ThrusterType {
    TUNNEL,
    AZIMUTH,
    PROPELLER,
    WATERJET
};

/**
 * @brief Maximum thruster force from maximum power (IMCA M 140)
 * @param type Thruster type
 * @param max_power_positive Maximum power, positive direction [kW]
 * @param max_power_negative Maximum power, negative direction [kW]
 * @return Pair of (max force positive, max force negative) [kN]; the negative force is <= 0
 * @throws std::invalid_argument for negative powers
 */
std::pair<double, double> imcaPowerToForce(ThrusterType type, double max_power_positive,
                                           double max_power_negative);

/**
 * @brief Thrust reduction ratio for two thrusters in line (ABS)
 * @param x Distance between the thrusters [m]
 * @param diameter Diameter of the downstream thruster [m]
 * @return Thrust reduction ratio t, so that the effective thrust is (1 - t) T
 */
double absInlineTandemReduction(double x, double diameter);

/**
 * @brief Thrust reduction ratio due to the Coanda effect (ABS)
 */
double absCoandaReduction();

} // namespace thrusters
} // namespace marcyb
