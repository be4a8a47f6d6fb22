#include "marcyb/config.hpp"
#include "marcyb/errors.hpp"
#include "marcyb/logging.hpp"
#include "marcyb/wind/wind_coefficients.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <stdexcept>

namespace marcyb {
namespace config {

template <typename T>
static T requiredKey(const YAML::Node& node, const std::string& key) {
    if (!node[key]) {
        throw ConfigError("Missing required key '" + key + "'");
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Bad value for key '" + key + "': " + e.what());
    }
}

template <typename T>
static std::optional<T> optionalKey(const YAML::Node& node, const std::string& key) {
    if (!node[key]) {
        return std::nullopt;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Bad value for key '" + key + "': " + e.what());
    }
}

VesselGeometry loadVesselGeometry(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        throw ConfigError("Vessel geometry must be a mapping");
    }

    VesselGeometry g(requiredKey<double>(node, "frontal_area"),
                     requiredKey<double>(node, "lateral_area"),
                     requiredKey<double>(node, "Loa"),
                     requiredKey<double>(node, "s_L"));
    g.vessel_type = optionalKey<std::string>(node, "vessel_type");
    g.superstructure_area = optionalKey<double>(node, "superstructure_area");
    g.breadth = optionalKey<double>(node, "breadth");
    g.S = optionalKey<double>(node, "S");
    g.masts = optionalKey<int>(node, "masts");

    wind::validateGeometry(g);
    return g;
}

WindCase loadWindCase(const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot load '" + filename + "': " + e.what());
    }
    if (!root.IsMap()) {
        throw ConfigError("'" + filename + "' is not a YAML mapping");
    }

    WindCase wc;
    wc.name = optionalKey<std::string>(root, "name").value_or(wc.name);
    wc.wind_speed = optionalKey<double>(root, "wind_speed").value_or(wc.wind_speed);
    if (!std::isfinite(wc.wind_speed) || wc.wind_speed < 0.0) {
        throw ConfigError("wind_speed must be finite and non-negative");
    }

    if (auto model = optionalKey<std::string>(root, "model")) {
        try {
            wc.model = coefficientModelFromString(*model);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }

    wc.geometry = loadVesselGeometry(root["vessel"]);

    const YAML::Node opts = root["options"];
    if (opts) {
        wc.options.temperature = optionalKey<double>(opts, "temperature").value_or(wc.options.temperature);
        wc.options.vessel_heading = optionalKey<double>(opts, "vessel_heading").value_or(wc.options.vessel_heading);
        wc.options.vessel_speed_surge = optionalKey<double>(opts, "vessel_speed_surge").value_or(wc.options.vessel_speed_surge);
        wc.options.vessel_speed_sway = optionalKey<double>(opts, "vessel_speed_sway").value_or(wc.options.vessel_speed_sway);
    }
    try {
        wc.options.validate();
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    logger()->info("Loaded wind case '{}' ({}) from {}", wc.name, toString(wc.model), filename);
    return wc;
}

} // namespace config
} // namespace marcyb
