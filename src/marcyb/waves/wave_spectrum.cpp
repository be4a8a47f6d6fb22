#include "marcyb/waves/wave_spectrum.hpp"
#include "marcyb/errors.hpp"
#include "marcyb/utils.hpp"
#include <cmath>
#include <stdexcept>

namespace marcyb {
namespace waves {

static constexpr double kGrav = 9.81;  // m/s^2

Spectrum piersonMoskowitz(double U_10, const PiersonMoskowitzOptions& options) {
    if (!(U_10 > 0.0)) {
        throw std::invalid_argument("piersonMoskowitz: U_10 must be positive");
    }
    if ((options.calc_alpha || options.calc_beta) && !(options.T_0 > 0.0)) {
        throw std::invalid_argument("piersonMoskowitz: T_0 must be positive to compute alpha or beta");
    }

    const double U_195 = 1.026 * U_10;
    const double omega_0 = kGrav / U_195;
    const double pi3 = std::pow(math::PI, 3);

    double alpha = options.alpha;
    if (options.calc_alpha) {
        alpha = 4.0 * pi3 * std::pow(options.H_s / (kGrav * options.T_0 * options.T_0), 2);
    }

    double beta = options.beta;
    if (options.calc_beta) {
        beta = 16.0 * pi3 * std::pow(U_195 / (kGrav * options.T_0), 4);
    }

    Spectrum s;
    s.frequencies = math::arange(0.01, 2.0, options.step_size);
    s.density.reserve(s.frequencies.size());
    for (double omega : s.frequencies) {
        s.density.push_back((alpha * kGrav * kGrav) / std::pow(omega, 5)
                            * std::exp(-beta * std::pow(omega_0 / omega, 4)));
    }
    return s;
}

Spectrum jonswap(double U_10, const JonswapOptions& options) {
    if (!(U_10 > 0.0)) {
        throw std::invalid_argument("jonswap: U_10 must be positive");
    }

    double omega_p = options.omega_p;
    double alpha = options.alpha;
    if (options.fetch_dependent) {
        if (!options.fetch) {
            throw MissingParameter("fetch", "Fetch-dependent JONSWAP");
        }
        const double fetch = *options.fetch;
        if (!(fetch > 0.0)) {
            throw std::invalid_argument("jonswap: fetch must be positive");
        }
        omega_p = (2.0 * math::PI * 16.04) / std::pow(fetch * U_10, 0.38);
        alpha = 0.076 * std::pow((fetch * kGrav) / (U_10 * U_10), -0.22);
    }
    if (!(omega_p > 0.0)) {
        throw std::invalid_argument("jonswap: omega_p must be positive");
    }

    Spectrum s;
    s.frequencies = math::arange(0.01, 2.0, options.step_size);
    s.density.reserve(s.frequencies.size());
    for (double omega : s.frequencies) {
        const double sigma = (omega <= omega_p) ? 0.07 : 0.09;
        const double r = std::exp(-std::pow(omega - omega_p, 2) / (2.0 * sigma * sigma * omega_p * omega_p));

        s.density.push_back((alpha * kGrav * kGrav) / std::pow(omega, 5)
                            * std::exp(-options.beta * std::pow(omega_p / omega, 4))
                            * std::pow(options.gamma, r));
    }
    return s;
}

} // namespace waves
} // namespace marcyb
