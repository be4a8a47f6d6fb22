#include "marcyb/trajgens/minimum_jerk.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace marcyb {
namespace trajgens {

Trajectory minimumJerkTrajectory(double current, double setpoint, double frequency, double move_time) {
    if (!(frequency > 0.0) || !(move_time > 0.0)) {
        throw std::invalid_argument("minimumJerkTrajectory: frequency and move time must be positive");
    }

    const double samples = move_time * frequency;
    if (!std::isfinite(samples) || samples >= static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("minimumJerkTrajectory: move_time * frequency exceeds int range");
    }
    const int timefreq = static_cast<int>(samples);
    const double distance = setpoint - current;
    const double n = static_cast<double>(timefreq);

    Trajectory traj;
    if (timefreq > 1) {
        traj.position.reserve(timefreq - 1);
        traj.velocity.reserve(timefreq - 1);
    }

    for (int k = 1; k < timefreq; ++k) {
        const double t = static_cast<double>(k);
        const double tau = t / n;

        traj.position.push_back(current + distance *
            (10.0 * std::pow(tau, 3) - 15.0 * std::pow(tau, 4) + 6.0 * std::pow(tau, 5)));

        traj.velocity.push_back(frequency * distance *
            (30.0 * std::pow(t, 2) / std::pow(n, 3)
             - 60.0 * std::pow(t, 3) / std::pow(n, 4)
             + 30.0 * std::pow(t, 4) / std::pow(n, 5)));
    }
    return traj;
}

} // namespace trajgens
} // namespace marcyb
