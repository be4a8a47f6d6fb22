#pragma once

#include <vector>

namespace marcyb {

/**
 * @brief Mathematical utility functions
 */
namespace math {

    constexpr double PI = 3.14159265358979323846;

    /**
     * @brief Linear interpolation
     * @param t Interpolation parameter [0, 1]
     * @param start Start value
     * @param end End value
     * @return Interpolated value
     */
    double lerp(double t, double start, double end);

    /**
     * @brief Clamp value to range
     * @param value Value to clamp
     * @param min_val Minimum value
     * @param max_val Maximum value
     * @return Clamped value
     */
    double clamp(double value, double min_val, double max_val);

    /**
     * @brief Evenly spaced values in the half-open interval [start, stop)
     *
     * Same sample count as numpy.arange: ceil((stop - start) / step), each
     * value computed as start + i * step.
     *
     * @param start First value
     * @param stop End of interval (excluded)
     * @param step Spacing, must be positive
     * @return Sampled values
     */
    std::vector<double> arange(double start, double stop, double step);

    inline double degToRad(double deg) { return deg * PI / 180.0; }
    inline double radToDeg(double rad) { return rad * 180.0 / PI; }
}

} // namespace marcyb
