#pragma once

#include <vector>

namespace marcyb {
namespace trajgens {

struct Trajectory {
    std::vector<double> position;
    std::vector<double> velocity;   // Time derivative of position
};

/**
 * @brief Minimum jerk trajectory from current to setpoint
 *
 * Samples the fifth order minimum jerk polynomial at the N - 1 interior
 * instants t = 1/f, ..., (N - 1)/f where N = int(move_time * frequency).
 * The start and end points themselves are not included.
 *
 * @param current Start value
 * @param setpoint End value
 * @param frequency Sample frequency of the system [Hz]
 * @param move_time Time to move from current to setpoint [s]
 * @throws std::invalid_argument for non-positive frequency or move time
 */
Trajectory minimumJerkTrajectory(double current, double setpoint, double frequency, double move_time);

} // namespace trajgens
} // namespace marcyb
