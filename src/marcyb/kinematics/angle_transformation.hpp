#pragma once

#include <utility>

namespace marcyb {
namespace kinematics {

/**
 * @brief Wrap an angle to [-pi, pi)
 * @param input_angle Angle [rad]
 * @return Pair of (wrapped angle [rad], revolutions removed); input = wrapped + 2 pi * revolutions
 * @throws std::invalid_argument for non-finite angles or more revolutions than an int holds
 */
std::pair<double, int> transformToPiPi(double input_angle);

/**
 * @brief Remainder of truncated division, same sign as the dividend
 * @throws std::invalid_argument when divisor is zero
 */
double truncatedRemainder(double dividend, double divisor);

} // namespace kinematics
} // namespace marcyb
