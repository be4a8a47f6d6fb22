#pragma once

#include "marcyb/types.hpp"
#include <string>
#include <vector>

namespace marcyb {
namespace wind {

/**
 * @brief Check the fields shared by all coefficient models
 *
 * Frontal area, lateral area and Loa must be strictly positive; breadth (if
 * given) strictly positive; superstructure_area, S and masts (if given)
 * non-negative.
 *
 * @throws InvalidGeometry on the first violated condition
 */
void validateGeometry(const VesselGeometry& geometry);

/**
 * @brief Blendermann (1994) wind coefficients
 *
 * Angle of attack uses the "wind coming from" convention, relative to the
 * bow. The longitudinal coefficient switches from CDl(0) to CDl(pi) when
 * |angle_of_attack| exceeds pi/2. The angle is not wrapped, so 2pi takes the
 * CDl(pi) branch.
 *
 * @param vessel_type Blendermann table key
 * @param frontal_area Frontal area [m²]
 * @param lateral_area Lateral area [m²]
 * @param Loa Length over all [m]
 * @param s_L Centroid of lateral area ahead of Lpp/2 [m]
 * @param angle_of_attack [rad]
 * @throws UnknownVesselType, NumericalError
 */
WindCoefficients blendermannCoefficients(const std::string& vessel_type, double frontal_area,
                                         double lateral_area, double Loa, double s_L,
                                         double angle_of_attack);

/**
 * @brief Isherwood (1972) wind coefficients for merchant vessels
 *
 * Regression coefficients are interpolated from the breakpoint tables at
 * the angle of attack in degrees, clamped to [0, 180].
 */
WindCoefficients isherwoodCoefficients(double frontal_area, double lateral_area,
                                       double superstructure_area, double Loa, double breadth,
                                       double S, double s_L, int masts, double angle_of_attack);

/**
 * @brief Wind coefficients with the selected model
 *
 * Validates the geometry and the fields the model needs, then dispatches.
 *
 * @throws InvalidGeometry, MissingParameter, UnknownVesselType
 */
WindCoefficients computeWindCoefficients(CoefficientModel model, const VesselGeometry& geometry,
                                         double angle_of_attack);

// Same as computeWindCoefficients for each angle in turn.
std::vector<WindCoefficients> sweepWindCoefficients(CoefficientModel model,
                                                    const VesselGeometry& geometry,
                                                    const std::vector<double>& angles_of_attack);

} // namespace wind
} // namespace marcyb
