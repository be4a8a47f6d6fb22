#include <gtest/gtest.h>
#include <cmath>
#include "marcyb/thrusters/power_to_force.hpp"

using namespace marcyb::thrusters;

class ThrustersTest : public ::testing::Test {
protected:
    static constexpr double kTolerance = 1e-2;  // kN
};

TEST_F(ThrustersTest, TunnelThrusterIsSymmetric) {
    const auto force = imcaPowerToForce(ThrusterType::TUNNEL, 880.0, 880.0);
    EXPECT_NEAR(force.first, 129.46, kTolerance);
    EXPECT_NEAR(force.second, -129.46, kTolerance);
}

TEST_F(ThrustersTest, AzimuthThruster) {
    const auto force = imcaPowerToForce(ThrusterType::AZIMUTH, 2200.0, 2200.0);
    EXPECT_NEAR(force.first, 382.50, kTolerance);
    EXPECT_NEAR(force.second, -235.39, kTolerance);
}

TEST_F(ThrustersTest, MainPropeller) {
    const auto force = imcaPowerToForce(ThrusterType::PROPELLER, 5000.0, 5000.0);
    EXPECT_NEAR(force.first, 869.32, kTolerance);
    EXPECT_NEAR(force.second, -608.52, kTolerance);
    EXPECT_NEAR(force.second, -0.7 * force.first, 1e-9);
}

TEST_F(ThrustersTest, WaterjetHasNoReverseThrust) {
    const auto force = imcaPowerToForce(ThrusterType::WATERJET, 1000.0, 1000.0);
    EXPECT_GT(force.first, 0.0);
    EXPECT_DOUBLE_EQ(force.second, 0.0);
}

TEST_F(ThrustersTest, ZeroPowerGivesZeroForce) {
    const auto force = imcaPowerToForce(ThrusterType::AZIMUTH, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(force.first, 0.0);
    EXPECT_DOUBLE_EQ(force.second, 0.0);
}

TEST_F(ThrustersTest, NegativePowerIsRejected) {
    EXPECT_THROW(imcaPowerToForce(ThrusterType::TUNNEL, -1.0, 0.0), std::invalid_argument);
    EXPECT_THROW(imcaPowerToForce(ThrusterType::TUNNEL, 0.0, -1.0), std::invalid_argument);
}

TEST_F(ThrustersTest, InlineTandemReduction) {
    EXPECT_DOUBLE_EQ(absInlineTandemReduction(0.0, 2.0), 0.0);
    EXPECT_NEAR(absInlineTandemReduction(2.0, 2.0), 0.25, 1e-12);
    EXPECT_NEAR(absInlineTandemReduction(16.0, 2.0), 1.0 - std::pow(0.75, 4.0), 1e-12);
    EXPECT_THROW(absInlineTandemReduction(1.0, 0.0), std::invalid_argument);
}

TEST_F(ThrustersTest, CoandaReduction) {
    EXPECT_DOUBLE_EQ(absCoandaReduction(), 0.97);
}
