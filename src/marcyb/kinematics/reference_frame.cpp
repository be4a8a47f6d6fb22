#include "marcyb/kinematics/reference_frame.hpp"
#include <cmath>

namespace marcyb {
namespace kinematics {

Matrix3d rotationBodyToNed(double psi) {
    const double c = std::cos(psi);
    const double s = std::sin(psi);

    Matrix3d R;
    R << c,  -s,  0.0,
         s,   c,  0.0,
         0.0, 0.0, 1.0;
    return R;
}

Vec3 rotateNedToBody(const Vec3& coords_ned) {
    return rotationBodyToNed(coords_ned(2)).transpose() * coords_ned;
}

Vec3 rotateBodyToNed(const Vec3& coords_body) {
    return rotationBodyToNed(coords_body(2)) * coords_body;
}

} // namespace kinematics
} // namespace marcyb
