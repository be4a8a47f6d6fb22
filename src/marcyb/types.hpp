#pragma once

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace marcyb {

using Vec3 = Eigen::Vector3d;
using Matrix3d = Eigen::Matrix3d;

/**
 * @brief Degree-of-freedom indices for surge/sway/yaw triples
 */
enum class DOF {
    SURGE = 0,                      // Longitudinal (0)
    SWAY,                           // Transverse (1)
    YAW                             // Rotation about the vertical axis (2)
};

/**
 * @brief Method used to obtain the non-dimensional wind load coefficients
 */
enum class CoefficientModel {
    BLENDERMANN,                    // Blendermann (1994), per vessel type
    ISHERWOOD                       // Isherwood (1972), merchant vessels
};

/**
 * @brief Vessel wind-area geometry
 *
 * Common fields are used by every coefficient model. The optional fields are
 * only read by the model that needs them:
 * - Blendermann: vessel_type
 * - Isherwood: superstructure_area, breadth, S, masts
 */
struct VesselGeometry {
    double frontal_area;                        // Frontal projected area [m²]
    double lateral_area;                        // Lateral projected area [m²]
    double Loa;                                 // Length over all [m]
    double s_L;                                 // Centroid of lateral area ahead of Lpp/2 [m]

    std::optional<std::string> vessel_type;     // Blendermann table key
    std::optional<double> superstructure_area;  // Lateral superstructure area [m²]
    std::optional<double> breadth;              // Breadth [m]
    std::optional<double> S;                    // Length of the lateral projection [m]
    std::optional<int> masts;                   // Distinct groups of masts or king posts

    // Default constructor
    VesselGeometry() : frontal_area(0.0), lateral_area(0.0), Loa(0.0), s_L(0.0) {}

    // Constructor with the fields shared by all models
    VesselGeometry(double frontal, double lateral, double length, double centroid)
        : frontal_area(frontal), lateral_area(lateral), Loa(length), s_L(centroid) {}
};

/**
 * @brief Non-dimensional wind load coefficients
 */
struct WindCoefficients {
    double C_X;     // Surge
    double C_Y;     // Sway
    double C_N;     // Yaw

    WindCoefficients() : C_X(0.0), C_Y(0.0), C_N(0.0) {}
    WindCoefficients(double cx, double cy, double cn) : C_X(cx), C_Y(cy), C_N(cn) {}

    Vec3 toVector() const {
        return Vec3(C_X, C_Y, C_N);
    }
};

/**
 * @brief Sampled spectral density
 */
struct Spectrum {
    std::vector<double> frequencies;    // [Hz] for wind, [rad/s] for waves
    std::vector<double> density;        // Spectral density at each frequency
};

/**
 * @brief Optional inputs of the wind force calculation
 *
 * Defaults describe a vessel at rest, heading north, in 20 °C air.
 */
struct WindForceOptions {
    double temperature;         // Air temperature [°C]
    double vessel_heading;      // Vessel heading [rad]
    double vessel_speed_surge;  // Vessel speed in surge [m/s]
    double vessel_speed_sway;   // Vessel speed in sway [m/s]

    WindForceOptions() : temperature(20.0), vessel_heading(0.0),
                         vessel_speed_surge(0.0), vessel_speed_sway(0.0) {}

    /**
     * @brief Throw std::invalid_argument unless every option is finite
     */
    void validate() const;
};

/**
 * @brief Convert a model name ("blendermann", "isherwood") to the enum
 * @throws std::invalid_argument for unrecognized names
 */
CoefficientModel coefficientModelFromString(const std::string& name);

/**
 * @brief Lower-case name of a coefficient model
 */
std::string toString(CoefficientModel model);

} // namespace marcyb
