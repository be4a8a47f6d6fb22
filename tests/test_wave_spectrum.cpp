#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "marcyb/errors.hpp"
#include "marcyb/waves/wave_spectrum.hpp"

using namespace marcyb;
using namespace marcyb::waves;

class WaveSpectrumTest : public ::testing::Test {
protected:
    static constexpr double g = 9.81;
    double U_10 = 10.0;
};

TEST_F(WaveSpectrumTest, PiersonMoskowitzFormula) {
    const Spectrum s = piersonMoskowitz(U_10);
    ASSERT_EQ(s.frequencies.size(), s.density.size());
    EXPECT_DOUBLE_EQ(s.frequencies.front(), 0.01);
    EXPECT_LT(s.frequencies.back(), 2.0);

    const double omega = s.frequencies[50];
    const double omega_0 = g / (1.026 * U_10);
    EXPECT_NEAR(s.density[50],
                0.0081 * g * g / std::pow(omega, 5) * std::exp(-0.74 * std::pow(omega_0 / omega, 4)),
                1e-9);
}

TEST_F(WaveSpectrumTest, PiersonMoskowitzPeak) {
    const Spectrum s = piersonMoskowitz(U_10);
    const auto peak = std::max_element(s.density.begin(), s.density.end()) - s.density.begin();

    // dS/domega = 0 at omega_p = omega_0 (4 beta / 5)^(1/4)
    const double omega_p = (g / (1.026 * U_10)) * std::pow(0.8 * 0.74, 0.25);
    EXPECT_NEAR(s.frequencies[peak], omega_p, 0.01);
}

TEST_F(WaveSpectrumTest, PiersonMoskowitzNeedsPeriod) {
    PiersonMoskowitzOptions opts;
    opts.calc_alpha = true;
    opts.H_s = 2.0;
    EXPECT_THROW(piersonMoskowitz(U_10, opts), std::invalid_argument);

    opts.T_0 = 8.0;
    const Spectrum s = piersonMoskowitz(U_10, opts);
    EXPECT_FALSE(s.density.empty());
}

TEST_F(WaveSpectrumTest, JonswapWithoutEnhancementMatchesPmShape) {
    JonswapOptions opts;
    opts.gamma = 1.0;
    const Spectrum s = jonswap(U_10, opts);

    for (std::size_t i = 0; i < s.frequencies.size(); i += 37) {
        const double omega = s.frequencies[i];
        EXPECT_NEAR(s.density[i],
                    0.0081 * g * g / std::pow(omega, 5) * std::exp(-1.25 * std::pow(0.5 / omega, 4)),
                    1e-9);
    }
}

TEST_F(WaveSpectrumTest, JonswapEnhancesPeak) {
    JonswapOptions flat;
    flat.gamma = 1.0;
    const Spectrum base = jonswap(U_10, flat);
    const Spectrum peaked = jonswap(U_10);

    // omega = 0.5 sits on the grid at index 49
    EXPECT_NEAR(peaked.frequencies[49], 0.5, 1e-12);
    EXPECT_NEAR(peaked.density[49] / base.density[49], 3.3, 1e-6);
}

TEST_F(WaveSpectrumTest, JonswapFetchDependentRequiresFetch) {
    JonswapOptions opts;
    opts.fetch_dependent = true;
    try {
        jonswap(U_10, opts);
        FAIL() << "Expected MissingParameter";
    } catch (const MissingParameter& e) {
        EXPECT_EQ(e.parameter(), "fetch");
    }

    opts.fetch = 100000.0;
    const Spectrum s = jonswap(U_10, opts);
    EXPECT_FALSE(s.density.empty());
}

TEST_F(WaveSpectrumTest, RejectsNonPositiveWindSpeed) {
    EXPECT_THROW(piersonMoskowitz(0.0), std::invalid_argument);
    EXPECT_THROW(jonswap(-2.0), std::invalid_argument);
}
