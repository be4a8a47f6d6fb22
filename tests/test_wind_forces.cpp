#include <gtest/gtest.h>
#include <cmath>
#include "marcyb/errors.hpp"
#include "marcyb/utils.hpp"
#include "marcyb/wind/wind_coefficients.hpp"
#include "marcyb/wind/wind_forces.hpp"

using namespace marcyb;
using namespace marcyb::wind;

class WindForcesTest : public ::testing::Test {
protected:
    void SetUp() override {
        osv = VesselGeometry(530.0, 1500.0, 107.5, 11.5);
        osv.vessel_type = "Offshore supply vessel";
        wind_speed = 10.0;
        q = 0.5 * computeRhoW(20.0) * wind_speed * wind_speed;
    }

    VesselGeometry osv;
    double wind_speed;
    double q;   // Dynamic pressure at 20 C [Pa]
};

TEST_F(WindForcesTest, AirDensityPolynomial) {
    EXPECT_NEAR(computeRhoW(20.0), 1.2039, 1e-4);
    EXPECT_NEAR(computeRhoW(0.0), 1.292, 1e-12);
    EXPECT_GT(computeRhoW(-20.0), computeRhoW(0.0));
    EXPECT_GT(computeRhoW(0.0), computeRhoW(40.0));
}

TEST_F(WindForcesTest, AirDensityOutsideFitStillEvaluates) {
    EXPECT_TRUE(std::isfinite(computeRhoW(60.0)));
    EXPECT_TRUE(std::isfinite(computeRhoW(-40.0)));
}

TEST_F(WindForcesTest, RelativeWindAtRest) {
    const RelativeWind rel = computeRelativeWind(wind_speed, math::PI / 2.0);
    EXPECT_NEAR(rel.speed, wind_speed, 1e-12);
    EXPECT_NEAR(rel.angle_of_attack, math::PI / 2.0, 1e-12);
    EXPECT_NEAR(rel.surge, 0.0, 1e-12);
    EXPECT_NEAR(rel.sway, -wind_speed, 1e-12);
}

TEST_F(WindForcesTest, RelativeWindIncludesVesselSpeedAndHeading) {
    WindForceOptions opts;
    opts.vessel_heading = math::PI / 2.0;
    opts.vessel_speed_surge = 5.0;

    // Wind from the bow after rotating by the heading
    const RelativeWind rel = computeRelativeWind(wind_speed, math::PI / 2.0, opts);
    EXPECT_NEAR(rel.surge, 5.0 - wind_speed, 1e-12);
    EXPECT_NEAR(rel.sway, 0.0, 1e-12);
    EXPECT_NEAR(rel.speed, 5.0, 1e-12);
}

TEST_F(WindForcesTest, SternWind) {
    const Vec3 tau = computeWindForceAndMoment(wind_speed, math::PI, osv, CoefficientModel::BLENDERMANN);

    EXPECT_NEAR(tau(0), 1e-3 * q * 0.80 * 530.0, 1e-9);
    EXPECT_NEAR(tau(0), 25.523, 1e-3);
    EXPECT_NEAR(tau(1), 0.0, 1e-9);
    EXPECT_NEAR(tau(2), 0.0, 1e-6);
}

TEST_F(WindForcesTest, BeamWind) {
    const Vec3 tau = computeWindForceAndMoment(wind_speed, math::PI / 2.0, osv, CoefficientModel::BLENDERMANN);

    EXPECT_NEAR(tau(0), 0.0, 1e-9);
    EXPECT_NEAR(tau(1), -1e-3 * q * 0.90 * 1500.0, 1e-6);
    EXPECT_NEAR(tau(1), -81.263, 1e-3);
    EXPECT_NEAR(tau(2), 1e-3 * q * (11.5 / 107.5) * -0.90 * 1500.0 * 107.5, 1e-4);
}

TEST_F(WindForcesTest, HeadWindAngleIsFullTurn) {
    EXPECT_NEAR(computeRelativeWind(wind_speed, 0.0).angle_of_attack, 2.0 * math::PI, 1e-12);

    // aoa = 2pi takes the CDl(pi) branch
    const Vec3 tau = computeWindForceAndMoment(wind_speed, 0.0, osv, CoefficientModel::BLENDERMANN);
    EXPECT_NEAR(tau(0), -1e-3 * q * 0.80 * 530.0, 1e-9);
    EXPECT_NEAR(tau(0), -25.523, 1e-3);
    EXPECT_NEAR(tau(1), 0.0, 1e-9);
}

TEST_F(WindForcesTest, CalmAirGivesNoLoad) {
    const Vec3 tau = computeWindForceAndMoment(0.0, 1.0, osv, CoefficientModel::BLENDERMANN);
    EXPECT_NEAR(tau.norm(), 0.0, 1e-12);
}

TEST_F(WindForcesTest, LoadScalesWithSpeedSquared) {
    const Vec3 slow = computeWindForceAndMoment(5.0, 2.0, osv, CoefficientModel::BLENDERMANN);
    const Vec3 fast = computeWindForceAndMoment(10.0, 2.0, osv, CoefficientModel::BLENDERMANN);
    for (int i = 0; i < 3; ++i) {
        EXPECT_NEAR(fast(i), 4.0 * slow(i), 1e-9);
    }
}

TEST_F(WindForcesTest, IsherwoodModel) {
    VesselGeometry merchant = osv;
    merchant.superstructure_area = 1500.0 / 9.0;
    merchant.breadth = 35.0;
    merchant.S = 107.5;
    merchant.masts = 1;

    const Vec3 tau = computeWindForceAndMoment(wind_speed, 1.0, merchant, CoefficientModel::ISHERWOOD);
    EXPECT_TRUE(tau.allFinite());
    // Wind from starboard pushes to port
    EXPECT_LT(tau(1), 0.0);
}

TEST_F(WindForcesTest, InvalidInputs) {
    EXPECT_THROW(computeWindForceAndMoment(-1.0, 0.0, osv, CoefficientModel::BLENDERMANN),
                 std::invalid_argument);
    EXPECT_THROW(computeWindForceAndMoment(10.0, std::nan(""), osv, CoefficientModel::BLENDERMANN),
                 std::invalid_argument);

    WindForceOptions opts;
    opts.temperature = std::nan("");
    EXPECT_THROW(computeWindForceAndMoment(10.0, 0.0, osv, CoefficientModel::BLENDERMANN, opts),
                 std::invalid_argument);

    VesselGeometry missing = osv;
    missing.vessel_type.reset();
    EXPECT_THROW(computeWindForceAndMoment(10.0, 0.0, missing, CoefficientModel::BLENDERMANN),
                 MissingParameter);
}

TEST_F(WindForcesTest, SweepMatchesPointwise) {
    const std::vector<double> directions = {0.0, 0.3, 1.2, math::PI / 2.0, 2.5, math::PI};
    const auto sweep = sweepWindForces(wind_speed, directions, osv, CoefficientModel::BLENDERMANN);
    ASSERT_EQ(sweep.size(), directions.size());
    for (std::size_t i = 0; i < directions.size(); ++i) {
        const Vec3 tau = computeWindForceAndMoment(wind_speed, directions[i], osv, CoefficientModel::BLENDERMANN);
        EXPECT_EQ(sweep[i], tau);
    }
}

TEST_F(WindForcesTest, CoefficientsFromRelativeWindMatchLoads) {
    WindForceOptions opts;
    opts.vessel_heading = 0.4;
    opts.vessel_speed_surge = 3.0;

    const double direction = 1.1;
    const RelativeWind rel = computeRelativeWind(wind_speed, direction, opts);
    const WindCoefficients c = sweepWindCoefficients(CoefficientModel::BLENDERMANN, osv,
                                                     {rel.angle_of_attack}).front();
    const Vec3 tau = computeWindForceAndMoment(wind_speed, direction, osv, CoefficientModel::BLENDERMANN, opts);

    const double q_rel = 0.5 * computeRhoW(20.0) * rel.speed * rel.speed;
    EXPECT_NEAR(tau(0), 1e-3 * q_rel * c.C_X * 530.0, 1e-9);
    EXPECT_NEAR(tau(1), 1e-3 * q_rel * c.C_Y * 1500.0, 1e-9);
    EXPECT_NEAR(tau(2), 1e-3 * q_rel * c.C_N * 1500.0 * 107.5, 1e-6);
}
