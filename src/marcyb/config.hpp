#pragma once

#include "marcyb/types.hpp"
#include <string>

namespace YAML {
class Node;
}

namespace marcyb {
namespace config {

/**
 * @brief Wind load case read from a YAML file
 */
struct WindCase {
    std::string name = "unnamed";
    VesselGeometry geometry;
    CoefficientModel model = CoefficientModel::BLENDERMANN;
    double wind_speed = 10.0;       // [m/s]
    WindForceOptions options;
};

/**
 * @brief Read a vessel geometry from a YAML mapping
 *
 * Required keys: frontal_area, lateral_area, Loa, s_L. Optional keys:
 * vessel_type, superstructure_area, breadth, S, masts.
 *
 * @throws ConfigError for missing or non-numeric keys
 * @throws InvalidGeometry when the values fail validation
 */
VesselGeometry loadVesselGeometry(const YAML::Node& node);

/**
 * @brief Load a wind load case
 *
 * Layout:
 * @code
 * name: Offshore supply vessel
 * model: blendermann          # or isherwood
 * wind_speed: 10.0            # m/s
 * vessel: { frontal_area: 530.0, lateral_area: 1500.0, Loa: 107.5, s_L: 11.5, ... }
 * options: { temperature: 20.0, vessel_heading: 0.0, vessel_speed_surge: 0.0, vessel_speed_sway: 0.0 }
 * @endcode
 *
 * @param filename Path to the case file
 * @throws ConfigError when the file cannot be parsed
 */
WindCase loadWindCase(const std::string& filename = "configs/offshore_supply_vessel.yaml");

} // namespace config
} // namespace marcyb
