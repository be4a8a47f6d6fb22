#include <iostream>
#include <iomanip>
#include <fstream>
#include <algorithm>
#include <vector>
#include "marcyb/filters/lowpass_filter.hpp"
#include "marcyb/kinematics/angle_transformation.hpp"
#include "marcyb/logging.hpp"
#include "marcyb/trajgens/minimum_jerk.hpp"

using namespace marcyb;

int main() {
    std::cout << "=== Minimum Jerk Trajectory Demo ===" << std::endl;
    std::cout << std::fixed << std::setprecision(4);

    const double current = 15.0;
    const double setpoint = 27.0;
    const double frequency = 100.0;    // Hz
    const double move_time = 12.0;     // s

    trajgens::Trajectory traj;
    std::vector<double> smoothed;
    try {
        traj = trajgens::minimumJerkTrajectory(current, setpoint, frequency, move_time);
        smoothed = filters::lowpassFilter(traj.velocity, 10.0);
    } catch (const std::exception& e) {
        logger()->error("{}", e.what());
        return 1;
    }

    const double v_max = *std::max_element(traj.velocity.begin(), traj.velocity.end());
    std::cout << "Samples: " << traj.position.size() << std::endl;
    std::cout << "Final position: " << traj.position.back() << std::endl;
    std::cout << "Max velocity: " << v_max << " (analytic " << 1.875 * (setpoint - current) / move_time << ")" << std::endl;

    std::ofstream csv("trajectory.csv");
    csv << "t,position,velocity,velocity_filtered\n";
    for (std::size_t i = 0; i < traj.position.size(); ++i) {
        csv << (i + 1) / frequency << "," << traj.position[i] << ","
            << traj.velocity[i] << "," << smoothed[i + 1] << "\n";
    }

    std::cout << "\n--- Angle wrapping ---" << std::endl;
    for (double a : {4.0, -4.0, 10.0}) {
        const auto wrapped = kinematics::transformToPiPi(a);
        std::cout << a << " rad -> " << wrapped.first << " rad, " << wrapped.second << " revolutions" << std::endl;
    }
    return 0;
}
