#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <cmath>
#include "marcyb/types.hpp"
#include "marcyb/utils.hpp"

using namespace marcyb;

class TypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_frontal_area = 530.0;
        test_lateral_area = 1500.0;
        test_loa = 107.5;
        test_s_L = 11.5;
    }

    double test_frontal_area;
    double test_lateral_area;
    double test_loa;
    double test_s_L;
};

// Test VesselGeometry struct
TEST_F(TypesTest, GeometryDefaultConstructor) {
    VesselGeometry g;

    EXPECT_EQ(g.frontal_area, 0.0);
    EXPECT_EQ(g.lateral_area, 0.0);
    EXPECT_EQ(g.Loa, 0.0);
    EXPECT_EQ(g.s_L, 0.0);
    EXPECT_FALSE(g.vessel_type.has_value());
    EXPECT_FALSE(g.superstructure_area.has_value());
    EXPECT_FALSE(g.breadth.has_value());
    EXPECT_FALSE(g.S.has_value());
    EXPECT_FALSE(g.masts.has_value());
}

TEST_F(TypesTest, GeometryParameterConstructor) {
    VesselGeometry g(test_frontal_area, test_lateral_area, test_loa, test_s_L);

    EXPECT_EQ(g.frontal_area, test_frontal_area);
    EXPECT_EQ(g.lateral_area, test_lateral_area);
    EXPECT_EQ(g.Loa, test_loa);
    EXPECT_EQ(g.s_L, test_s_L);
}

// Test WindCoefficients struct
TEST_F(TypesTest, CoefficientsToVector) {
    WindCoefficients c(0.8, -0.9, 0.1);
    Vec3 v = c.toVector();

    EXPECT_EQ(v(static_cast<int>(DOF::SURGE)), 0.8);
    EXPECT_EQ(v(static_cast<int>(DOF::SWAY)), -0.9);
    EXPECT_EQ(v(static_cast<int>(DOF::YAW)), 0.1);
    EXPECT_EQ(WindCoefficients().toVector(), Vec3::Zero());
}

// Test WindForceOptions struct
TEST_F(TypesTest, OptionsDefaults) {
    WindForceOptions opts;

    EXPECT_EQ(opts.temperature, 20.0);
    EXPECT_EQ(opts.vessel_heading, 0.0);
    EXPECT_EQ(opts.vessel_speed_surge, 0.0);
    EXPECT_EQ(opts.vessel_speed_sway, 0.0);
    EXPECT_NO_THROW(opts.validate());
}

TEST_F(TypesTest, OptionsRejectNonFinite) {
    WindForceOptions opts;
    opts.vessel_heading = INFINITY;
    EXPECT_THROW(opts.validate(), std::invalid_argument);

    opts = WindForceOptions();
    opts.vessel_speed_sway = std::nan("");
    EXPECT_THROW(opts.validate(), std::invalid_argument);
}

// Test model names
TEST_F(TypesTest, ModelNames) {
    EXPECT_EQ(coefficientModelFromString("blendermann"), CoefficientModel::BLENDERMANN);
    EXPECT_EQ(coefficientModelFromString("Isherwood"), CoefficientModel::ISHERWOOD);
    EXPECT_EQ(toString(CoefficientModel::ISHERWOOD), "isherwood");
    EXPECT_EQ(coefficientModelFromString(toString(CoefficientModel::BLENDERMANN)),
              CoefficientModel::BLENDERMANN);
    EXPECT_THROW(coefficientModelFromString("fossen"), std::invalid_argument);
}

// Test math utilities
TEST_F(TypesTest, Arange) {
    std::vector<double> v = math::arange(0.0, 1.0, 0.25);
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[3], 0.75);

    EXPECT_TRUE(math::arange(1.0, 1.0, 0.1).empty());
    EXPECT_THROW(math::arange(0.0, 1.0, 0.0), std::invalid_argument);
}

TEST_F(TypesTest, InterpolationAndAngles) {
    EXPECT_EQ(math::lerp(0.25, 2.0, 6.0), 3.0);
    EXPECT_EQ(math::clamp(5.0, 0.0, 1.0), 1.0);
    EXPECT_NEAR(math::degToRad(180.0), math::PI, 1e-15);
    EXPECT_NEAR(math::radToDeg(math::PI / 2.0), 90.0, 1e-12);
}
