#include <gtest/gtest.h>
#include <cmath>
#include "marcyb/kinematics/angle_transformation.hpp"
#include "marcyb/kinematics/reference_frame.hpp"
#include "marcyb/utils.hpp"

using namespace marcyb;
using namespace marcyb::kinematics;

class KinematicsTest : public ::testing::Test {
protected:
    static constexpr double kTolerance = 1e-12;
};

TEST_F(KinematicsTest, WrapPositiveAngle) {
    const auto result = transformToPiPi(4.0);
    EXPECT_NEAR(result.first, 4.0 - 2.0 * math::PI, kTolerance);
    EXPECT_NEAR(result.first, -2.283, 1e-3);
    EXPECT_EQ(result.second, 1);
}

TEST_F(KinematicsTest, WrapNegativeAngle) {
    const auto result = transformToPiPi(-4.0);
    EXPECT_NEAR(result.first, 2.283, 1e-3);
    EXPECT_EQ(result.second, -1);
}

TEST_F(KinematicsTest, WrapKeepsAnglesInRange) {
    EXPECT_DOUBLE_EQ(transformToPiPi(0.0).first, 0.0);
    EXPECT_EQ(transformToPiPi(0.0).second, 0);

    const auto pi = transformToPiPi(math::PI);
    EXPECT_NEAR(pi.first, -math::PI, kTolerance);
    EXPECT_EQ(pi.second, 1);

    for (double a = -20.0; a <= 20.0; a += 0.37) {
        const auto r = transformToPiPi(a);
        EXPECT_GE(r.first, -math::PI);
        EXPECT_LT(r.first, math::PI);
        EXPECT_NEAR(r.first + 2.0 * math::PI * r.second, a, 1e-9);
    }
}

TEST_F(KinematicsTest, WrapRejectsNonFinite) {
    EXPECT_THROW(transformToPiPi(std::nan("")), std::invalid_argument);
}

TEST_F(KinematicsTest, WrapLargeAngles) {
    // 1e9 rad is about 1.6e8 revolutions, still representable
    const auto r = transformToPiPi(1e9);
    EXPECT_GE(r.first, -math::PI);
    EXPECT_LT(r.first, math::PI);
    EXPECT_NEAR(r.first + 2.0 * math::PI * r.second, 1e9, 1e-4);

    EXPECT_THROW(transformToPiPi(1e12), std::invalid_argument);
    EXPECT_THROW(transformToPiPi(-1e12), std::invalid_argument);
}

TEST_F(KinematicsTest, TruncatedRemainderFollowsDividendSign) {
    EXPECT_DOUBLE_EQ(truncatedRemainder(7.0, 3.0), 1.0);
    EXPECT_DOUBLE_EQ(truncatedRemainder(-7.0, 3.0), -1.0);
    EXPECT_DOUBLE_EQ(truncatedRemainder(7.0, -3.0), 1.0);
    EXPECT_THROW(truncatedRemainder(1.0, 0.0), std::invalid_argument);
}

TEST_F(KinematicsTest, RotationMatrixIsOrthonormal) {
    const Matrix3d R = rotationBodyToNed(0.8);
    EXPECT_TRUE((R * R.transpose()).isApprox(Matrix3d::Identity(), 1e-12));
    EXPECT_NEAR(R.determinant(), 1.0, kTolerance);
}

TEST_F(KinematicsTest, BodyToNedQuarterTurn) {
    const Vec3 ned = rotateBodyToNed(Vec3(1.0, 0.0, math::PI / 2.0));
    EXPECT_NEAR(ned(0), 0.0, kTolerance);
    EXPECT_NEAR(ned(1), 1.0, kTolerance);
    EXPECT_DOUBLE_EQ(ned(2), math::PI / 2.0);
}

TEST_F(KinematicsTest, NedToBodyInvertsBodyToNed) {
    const Vec3 body(3.0, -2.0, 0.6);
    const Vec3 back = rotateNedToBody(rotateBodyToNed(body));
    EXPECT_TRUE(back.isApprox(body, 1e-12));
}
