#pragma once

#include "marcyb/types.hpp"

namespace marcyb {
namespace kinematics {

/**
 * @brief Rotation about the vertical axis, BODY to NED
 * @param psi Heading [rad]
 */
Matrix3d rotationBodyToNed(double psi);

/**
 * @brief Rotate (north, east, psi) from NED to BODY (surge, sway, psi)
 *
 * Assumes small roll and pitch; the heading is taken from the third
 * component.
 */
Vec3 rotateNedToBody(const Vec3& coords_ned);

/**
 * @brief Rotate (surge, sway, psi) from BODY to NED
 */
Vec3 rotateBodyToNed(const Vec3& coords_body);

} // namespace kinematics
} // namespace marcyb
