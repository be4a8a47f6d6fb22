#pragma once

#include "marcyb/types.hpp"
#include <optional>

namespace marcyb {
namespace wind {

enum class WindSpectrumType {
    DAVENPORT,
    HARRIS,
    OCHI_SHIN,
    NPD,
    API
};

/**
 * @brief Parameters for computeWindSpectrum
 *
 * Unset optionals take the default of the selected spectrum.
 */
struct WindSpectrumParams {
    double U_10;                        // Mean wind speed at 10 m [m/s]
    std::optional<double> kappa;        // Surface drag coefficient (Davenport, Harris)
    std::optional<double> L;            // Scale length [m] (Davenport, Harris)
    std::optional<double> C;            // Surface drag coefficient C_10 (Ochi-Shin), spectrum parameter (API)
    double step_size;                   // Frequency resolution

    explicit WindSpectrumParams(double u10 = 10.0) : U_10(u10), step_size(0.001) {}
};

/**
 * @brief Davenport (1961) wind gust spectrum on f in [0, 1) Hz
 * @param U_10 Mean wind speed at 10 m [m/s]
 * @param kappa Surface drag coefficient
 * @param L Scale length [m]
 * @param step_size Frequency resolution [Hz]
 */
Spectrum davenport(double U_10, double kappa = 0.0025, double L = 1200.0, double step_size = 0.001);

/**
 * @brief Harris (1983) wind gust spectrum on f in [0, 1) Hz
 *
 * Not valid below 1e-2 Hz. Also known as the DNV spectrum.
 */
Spectrum harris(double U_10, double kappa = 0.0025, double L = 1800.0, double step_size = 0.001);

/**
 * @brief Ochi-Shin (1988) wind gust spectrum
 *
 * Sampled on non-dimensional frequencies f* in [0.001, 1); the returned
 * frequencies are the dimensional U_10 * f*.
 *
 * @param C_10 Surface drag coefficient at 10 m
 */
Spectrum ochiShin(double U_10, double C_10 = 0.025, double step_size = 0.001);

/**
 * @brief Norwegian Petroleum Directorate wind gust spectrum on f in [0, 1) Hz
 */
Spectrum npd(double U_10, double step_size = 0.001);

/**
 * @brief American Petroleum Institute wind gust spectrum on f in [0, 1) Hz
 * @param C Spectrum parameter, between 0.01 and 0.1
 */
Spectrum api(double U_10, double C = 0.025, double step_size = 0.001);

/**
 * @brief Mean wind speed at height z from the mean wind speed at 10 m
 * @param U_10 Mean wind speed at 10 m [m/s]
 * @param C_10 Surface drag coefficient at 10 m
 * @param z Height above sea level [m]
 * @return Mean wind speed at z [m/s]
 */
double u10ToUz(double U_10, double C_10, double z);

Spectrum computeWindSpectrum(WindSpectrumType type, const WindSpectrumParams& params);

} // namespace wind
} // namespace marcyb
