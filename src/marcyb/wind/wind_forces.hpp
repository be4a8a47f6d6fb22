#pragma once

#include "marcyb/types.hpp"
#include <vector>

namespace marcyb {
namespace wind {

/**
 * @brief Wind velocity relative to the vessel, in BODY
 */
struct RelativeWind {
    double surge;           // Relative velocity in surge [m/s]
    double sway;            // Relative velocity in sway [m/s]
    double speed;           // Relative wind speed [m/s]
    double angle_of_attack; // Direction the wind is coming from, relative to the bow [rad]
};

/**
 * @brief Density of air from temperature
 *
 * Fifth order polynomial regression of tabulated air density at
 * atmospheric pressure, fitted between -25 and 50 °C.
 *
 * @param temperature Air temperature [°C]
 * @return Density [kg/m³]
 */
double computeRhoW(double temperature);

/**
 * @brief Resolve wind speed and direction against vessel heading and speed
 * @param wind_speed Wind speed [m/s]
 * @param wind_direction Wind direction [rad]
 * @param options Vessel heading and speed (temperature is not used here)
 * @return Relative wind, angle of attack in [0, 2pi]
 */
RelativeWind computeRelativeWind(double wind_speed, double wind_direction,
                                 const WindForceOptions& options = WindForceOptions());

/**
 * @brief Wind forces in surge and sway and moment in yaw
 * @param wind_speed Wind speed [m/s]
 * @param wind_direction Wind direction [rad]
 * @param geometry Vessel wind-area geometry
 * @param model Coefficient model
 * @param options Temperature, vessel heading and vessel speed
 * @return (F_surge [kN], F_sway [kN], M_yaw [kNm])
 * @throws InvalidGeometry, MissingParameter, UnknownVesselType, std::invalid_argument
 */
Vec3 computeWindForceAndMoment(double wind_speed, double wind_direction,
                               const VesselGeometry& geometry, CoefficientModel model,
                               const WindForceOptions& options = WindForceOptions());

/**
 * @brief Wind forces and moment for a sequence of wind directions
 */
std::vector<Vec3> sweepWindForces(double wind_speed, const std::vector<double>& wind_directions,
                                  const VesselGeometry& geometry, CoefficientModel model,
                                  const WindForceOptions& options = WindForceOptions());

} // namespace wind
} // namespace marcyb
