#pragma once

#include "marcyb/types.hpp"
#include <optional>

namespace marcyb {
namespace waves {

struct PiersonMoskowitzOptions {
    bool calc_alpha = false;    // Compute alpha from H_s and T_0
    double alpha = 0.0081;      // Phillips constant
    double H_s = 0.0;           // Significant wave height [m]
    double T_0 = 0.0;           // Zero-crossing period [s]
    bool calc_beta = false;     // Compute beta from U_19.5 and T_0
    double beta = 0.74;
    double step_size = 0.01;    // [rad/s]
};

struct JonswapOptions {
    bool fetch_dependent = false;   // Compute alpha and omega_p from the fetch
    std::optional<double> fetch;    // Fetch length [m]
    double alpha = 0.0081;
    double beta = 1.25;
    double gamma = 3.3;             // Peak enhancement factor
    double omega_p = 0.5;           // Peak frequency [rad/s]
    double step_size = 0.01;        // [rad/s]
};

/**
 * @brief Pierson-Moskowitz wave spectrum on omega in [0.01, 2) rad/s
 *
 * Fully developed sea (infinite fetch and duration). U_19.5 is taken as
 * 1.026 * U_10, which assumes a drag coefficient of 1.3e-3.
 *
 * @param U_10 Wind speed 10 m above sea level [m/s]
 * @param options Spectrum parameters
 * @throws std::invalid_argument when alpha or beta must be computed and T_0 is not positive
 */
Spectrum piersonMoskowitz(double U_10, const PiersonMoskowitzOptions& options = PiersonMoskowitzOptions());

/**
 * @brief JONSWAP wave spectrum on omega in [0.01, 2) rad/s
 * @throws MissingParameter when fetch_dependent is set without a fetch
 */
Spectrum jonswap(double U_10, const JonswapOptions& options = JonswapOptions());

} // namespace waves
} // namespace marcyb
