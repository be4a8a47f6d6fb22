#include "marcyb/wind/wind_forces.hpp"
#include "marcyb/logging.hpp"
#include "marcyb/utils.hpp"
#include "marcyb/wind/wind_coefficients.hpp"
#include <cmath>
#include <stdexcept>

namespace marcyb {
namespace wind {

// Range of the tabulated data behind the density polynomial
static constexpr double kRhoFitMinTemperature = -25.0;  // °C
static constexpr double kRhoFitMaxTemperature = 50.0;   // °C

double computeRhoW(double temperature) {
    if (temperature < kRhoFitMinTemperature || temperature > kRhoFitMaxTemperature) {
        logger()->warn("Air temperature {:.1f} C outside density fit range [{:.0f}, {:.0f}] C",
                       temperature, kRhoFitMinTemperature, kRhoFitMaxTemperature);
    }

    const double T = temperature;
    return 3.318e-12 * std::pow(T, 5) + 1.172e-10 * std::pow(T, 4)
         - 6.845e-8  * std::pow(T, 3) + 1.744e-5  * std::pow(T, 2)
         - 4.728e-3  * T              + 1.292;
}

RelativeWind computeRelativeWind(double wind_speed, double wind_direction,
                                 const WindForceOptions& options) {
    const double wind_speed_surge = wind_speed * std::cos(wind_direction - options.vessel_heading);
    const double wind_speed_sway = wind_speed * std::sin(wind_direction - options.vessel_heading);

    RelativeWind rel;
    rel.surge = options.vessel_speed_surge - wind_speed_surge;
    rel.sway = options.vessel_speed_sway - wind_speed_sway;
    rel.speed = std::sqrt(rel.surge * rel.surge + rel.sway * rel.sway);

    // The wind is coming from the angle of attack
    rel.angle_of_attack = std::atan2(rel.sway, rel.surge) + math::PI;
    return rel;
}

static void checkWindInput(double wind_speed, double wind_direction) {
    if (!std::isfinite(wind_speed) || wind_speed < 0.0) {
        throw std::invalid_argument("Wind speed must be finite and non-negative");
    }
    if (!std::isfinite(wind_direction)) {
        throw std::invalid_argument("Wind direction must be finite");
    }
}

static Vec3 forceAndMoment(double rho_w, const RelativeWind& rel, const WindCoefficients& c,
                           const VesselGeometry& geometry) {
    const double q = 0.5 * rho_w * rel.speed * rel.speed;
    return Vec3(1e-3 * q * c.C_X * geometry.frontal_area,
                1e-3 * q * c.C_Y * geometry.lateral_area,
                1e-3 * q * c.C_N * geometry.lateral_area * geometry.Loa);
}

Vec3 computeWindForceAndMoment(double wind_speed, double wind_direction,
                               const VesselGeometry& geometry, CoefficientModel model,
                               const WindForceOptions& options) {
    options.validate();
    checkWindInput(wind_speed, wind_direction);

    const double rho_w = computeRhoW(options.temperature);
    const RelativeWind rel = computeRelativeWind(wind_speed, wind_direction, options);
    logger()->debug("Relative wind {:.3f} m/s from {:.4f} rad", rel.speed, rel.angle_of_attack);

    const WindCoefficients c = computeWindCoefficients(model, geometry, rel.angle_of_attack);
    return forceAndMoment(rho_w, rel, c, geometry);
}

std::vector<Vec3> sweepWindForces(double wind_speed, const std::vector<double>& wind_directions,
                                  const VesselGeometry& geometry, CoefficientModel model,
                                  const WindForceOptions& options) {
    options.validate();
    const double rho_w = computeRhoW(options.temperature);

    std::vector<double> angles;
    std::vector<RelativeWind> relative;
    angles.reserve(wind_directions.size());
    relative.reserve(wind_directions.size());
    for (double direction : wind_directions) {
        checkWindInput(wind_speed, direction);
        relative.push_back(computeRelativeWind(wind_speed, direction, options));
        angles.push_back(relative.back().angle_of_attack);
    }

    const std::vector<WindCoefficients> coefficients = sweepWindCoefficients(model, geometry, angles);

    std::vector<Vec3> result;
    result.reserve(wind_directions.size());
    for (std::size_t i = 0; i < relative.size(); ++i) {
        result.push_back(forceAndMoment(rho_w, relative[i], coefficients[i], geometry));
    }
    return result;
}

} // namespace wind
} // namespace marcyb
