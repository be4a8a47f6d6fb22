#include "marcyb/wind/wind_spectrum.hpp"
#include "marcyb/utils.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace marcyb {
namespace wind {

static void checkU10(double U_10, const char* name) {
    if (!std::isfinite(U_10) || U_10 <= 0.0) {
        throw std::invalid_argument(std::string(name) + ": U_10 must be positive");
    }
}

Spectrum davenport(double U_10, double kappa, double L, double step_size) {
    checkU10(U_10, "davenport");

    Spectrum s;
    s.frequencies = math::arange(0.0, 1.0, step_size);
    s.density.reserve(s.frequencies.size());
    for (double f : s.frequencies) {
        const double chi = f * L / U_10;
        s.density.push_back((4.0 * kappa * L * U_10 * chi) / std::pow(1.0 + chi * chi, 4.0 / 3.0));
    }
    return s;
}

Spectrum harris(double U_10, double kappa, double L, double step_size) {
    checkU10(U_10, "harris");

    Spectrum s;
    s.frequencies = math::arange(0.0, 1.0, step_size);
    s.density.reserve(s.frequencies.size());
    for (double f : s.frequencies) {
        const double chi = f * L / U_10;
        s.density.push_back((4.0 * kappa * L * U_10) / std::pow(2.0 + chi * chi, 5.0 / 6.0));
    }
    return s;
}

Spectrum ochiShin(double U_10, double C_10, double step_size) {
    checkU10(U_10, "ochiShin");

    const std::vector<double> f_stars = math::arange(0.001, 1.0, step_size);
    const double u_star = std::sqrt(C_10) * U_10;

    Spectrum s;
    s.frequencies.reserve(f_stars.size());
    s.density.reserve(f_stars.size());
    for (double f_star : f_stars) {
        double nondimensional;
        if (f_star <= 0.003) {
            nondimensional = 583.0 * f_star;
        } else if (f_star <= 0.1) {
            nondimensional = (420.0 * std::pow(f_star, 0.70)) / std::pow(1.0 + std::pow(f_star, 0.35), 11.5);
        } else {
            nondimensional = (838.0 * f_star) / std::pow(1.0 + std::pow(f_star, 0.35), 11.5);
        }

        const double frequency = U_10 * f_star;
        s.frequencies.push_back(frequency);
        s.density.push_back(nondimensional * u_star * u_star / frequency);
    }
    return s;
}

Spectrum npd(double U_10, double step_size) {
    checkU10(U_10, "npd");

    const double n = 0.468;
    const double u_ratio = U_10 / 10.0;

    Spectrum s;
    s.frequencies = math::arange(0.0, 1.0, step_size);
    s.density.reserve(s.frequencies.size());
    for (double f : s.frequencies) {
        const double f_bar = 172.0 * f * std::pow(u_ratio, -0.75);
        s.density.push_back((320.0 * u_ratio * u_ratio) / std::pow(1.0 + std::pow(f_bar, n), 5.0 / (3.0 * n)));
    }
    return s;
}

Spectrum api(double U_10, double C, double step_size) {
    checkU10(U_10, "api");
    if (!(C > 0.0)) {
        throw std::invalid_argument("api: spectrum parameter C must be positive");
    }

    const double sigma = 0.15 * U_10 * std::pow(0.5, -0.125);
    const double f_p = C * 0.1 * U_10;

    Spectrum s;
    s.frequencies = math::arange(0.0, 1.0, step_size);
    s.density.reserve(s.frequencies.size());
    for (double f : s.frequencies) {
        s.density.push_back((sigma * sigma / f_p) / (1.0 + 1.5 * std::pow(f / f_p, 5.0 / 3.0)));
    }
    return s;
}

double u10ToUz(double U_10, double C_10, double z) {
    if (!(z > 0.0)) {
        throw std::invalid_argument("u10ToUz: height must be positive");
    }
    if (C_10 < 0.0 || U_10 < 0.0) {
        throw std::invalid_argument("u10ToUz: U_10 and C_10 must be non-negative");
    }

    const double u_star = std::sqrt(C_10 * U_10);
    return U_10 + 2.5 * u_star * std::log(z / 10.0);
}

Spectrum computeWindSpectrum(WindSpectrumType type, const WindSpectrumParams& p) {
    switch (type) {
        case WindSpectrumType::DAVENPORT:
            return davenport(p.U_10, p.kappa.value_or(0.0025), p.L.value_or(1200.0), p.step_size);
        case WindSpectrumType::HARRIS:
            return harris(p.U_10, p.kappa.value_or(0.0025), p.L.value_or(1800.0), p.step_size);
        case WindSpectrumType::OCHI_SHIN:
            return ochiShin(p.U_10, p.C.value_or(0.025), p.step_size);
        case WindSpectrumType::NPD:
            return npd(p.U_10, p.step_size);
        case WindSpectrumType::API:
            return api(p.U_10, p.C.value_or(0.025), p.step_size);
    }
    throw std::invalid_argument("Unknown wind spectrum type");
}

} // namespace wind
} // namespace marcyb
