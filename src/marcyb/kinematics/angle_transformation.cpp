#include "marcyb/kinematics/angle_transformation.hpp"
#include "marcyb/utils.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace marcyb {
namespace kinematics {

std::pair<double, int> transformToPiPi(double input_angle) {
    if (!std::isfinite(input_angle)) {
        throw std::invalid_argument("transformToPiPi: angle must be finite");
    }

    const double two_pi = 2.0 * math::PI;
    const double revolutions = std::floor((input_angle + math::PI) / two_pi);
    if (std::abs(revolutions) >= static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("transformToPiPi: revolution count exceeds int range");
    }
    double output_angle = input_angle - two_pi * revolutions;

    // Rounding can leave the result exactly on +pi
    if (output_angle >= math::PI) {
        output_angle -= two_pi;
        return {output_angle, static_cast<int>(revolutions) + 1};
    }
    return {output_angle, static_cast<int>(revolutions)};
}

double truncatedRemainder(double dividend, double divisor) {
    if (divisor == 0.0) {
        throw std::invalid_argument("truncatedRemainder: divisor must be non-zero");
    }
    return dividend - divisor * std::trunc(dividend / divisor);
}

} // namespace kinematics
} // namespace marcyb
