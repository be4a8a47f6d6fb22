#pragma once

#include <stdexcept>
#include <string>

namespace marcyb {

// Blendermann table has no row with this exact name.
class UnknownVesselType : public std::invalid_argument {
public:
    explicit UnknownVesselType(const std::string& vessel_type)
        : std::invalid_argument("Unknown Blendermann vessel type: '" + vessel_type + "'"),
          vessel_type_(vessel_type) {}

    const std::string& vesselType() const { return vessel_type_; }

private:
    std::string vessel_type_;
};

// A field required by the selected model was not supplied.
class MissingParameter : public std::invalid_argument {
public:
    MissingParameter(const std::string& parameter, const std::string& context)
        : std::invalid_argument(context + " requires parameter '" + parameter + "'"),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// Non-positive area, length or breadth.
class InvalidGeometry : public std::invalid_argument {
public:
    explicit InvalidGeometry(const std::string& msg) : std::invalid_argument(msg) {}
};

// A formula reached a singular or non-finite intermediate value.
class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& msg) : std::runtime_error(msg) {}
};

// Case file could not be read or is malformed.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace marcyb
