#include "marcyb/wind/wind_coefficients.hpp"
#include "marcyb/errors.hpp"
#include "marcyb/utils.hpp"
#include "marcyb/wind/coefficient_tables.hpp"
#include <cmath>

namespace marcyb {
namespace wind {

static constexpr double kMinDenominator = 1e-9;

static inline bool positive(double x) {
    return std::isfinite(x) && x > 0.0;
}

void validateGeometry(const VesselGeometry& g) {
    if (!positive(g.frontal_area)) {
        throw InvalidGeometry("frontal_area must be positive");
    }
    if (!positive(g.lateral_area)) {
        throw InvalidGeometry("lateral_area must be positive");
    }
    if (!positive(g.Loa)) {
        throw InvalidGeometry("Loa must be positive");
    }
    if (!std::isfinite(g.s_L)) {
        throw InvalidGeometry("s_L must be finite");
    }
    if (g.breadth && !positive(*g.breadth)) {
        throw InvalidGeometry("breadth must be positive");
    }
    if (g.superstructure_area && !(std::isfinite(*g.superstructure_area) && *g.superstructure_area >= 0.0)) {
        throw InvalidGeometry("superstructure_area must be finite and non-negative");
    }
    if (g.S && !(std::isfinite(*g.S) && *g.S >= 0.0)) {
        throw InvalidGeometry("S must be finite and non-negative");
    }
    if (g.masts && *g.masts < 0) {
        throw InvalidGeometry("masts must be non-negative");
    }
}

WindCoefficients blendermannCoefficients(const std::string& vessel_type, double frontal_area,
                                         double lateral_area, double Loa, double s_L,
                                         double angle_of_attack) {
    const BlendermannRow& row = CoefficientTables::lookupBlendermann(vessel_type);

    // Head or stern wind
    double CDl;
    if (std::abs(angle_of_attack) <= math::PI / 2.0) {
        CDl = row.CDl0 * (frontal_area / lateral_area);
    } else {
        CDl = row.CDlpi * (frontal_area / lateral_area);
    }

    const double sin_2a = std::sin(2.0 * angle_of_attack);
    const double denominator = 1.0 - 0.5 * row.delta * (1.0 - CDl / row.CDt) * sin_2a * sin_2a;
    if (!(std::abs(denominator) > kMinDenominator)) {
        throw NumericalError("Blendermann denominator vanished for '" + vessel_type + "'");
    }

    WindCoefficients c;
    c.C_X = -CDl * (lateral_area / frontal_area) * std::cos(angle_of_attack) / denominator;
    c.C_Y = -row.CDt * std::sin(angle_of_attack) / denominator;
    c.C_N = (s_L / Loa - 0.18 * (angle_of_attack - math::PI / 2.0)) * c.C_Y;
    return c;
}

WindCoefficients isherwoodCoefficients(double frontal_area, double lateral_area,
                                       double superstructure_area, double Loa, double breadth,
                                       double S, double s_L, int masts, double angle_of_attack) {
    const double angle_deg = math::radToDeg(angle_of_attack);

    const Eigen::VectorXd A = CoefficientTables::interpolateIsherwood(IsherwoodTable::SURGE, angle_deg);
    const Eigen::VectorXd B = CoefficientTables::interpolateIsherwood(IsherwoodTable::SWAY, angle_deg);
    const Eigen::VectorXd C = CoefficientTables::interpolateIsherwood(IsherwoodTable::YAW, angle_deg);

    // Distance from the bow to the centroid of the lateral projection
    const double bow_centroid_distance = Loa / 2.0 - s_L;

    const double lateral_ratio = (2.0 * lateral_area) / (Loa * Loa);
    const double frontal_ratio = (2.0 * frontal_area) / (breadth * breadth);
    const double length_breadth = Loa / breadth;
    const double projection_ratio = S / Loa;
    const double centroid_ratio = bow_centroid_distance / Loa;

    WindCoefficients c;
    c.C_X = -(A(0) + A(1) * lateral_ratio + A(2) * frontal_ratio + A(3) * length_breadth
              + A(4) * projection_ratio + A(5) * centroid_ratio + A(6) * masts);
    c.C_Y = -(B(0) + B(1) * lateral_ratio + B(2) * frontal_ratio + B(3) * length_breadth
              + B(4) * projection_ratio + B(5) * centroid_ratio
              + B(6) * (superstructure_area / lateral_area));
    c.C_N = C(0) + C(1) * lateral_ratio + C(2) * frontal_ratio + C(3) * length_breadth
            + C(4) * projection_ratio + C(5) * centroid_ratio;
    return c;
}

static void requireModelFields(CoefficientModel model, const VesselGeometry& g) {
    switch (model) {
        case CoefficientModel::BLENDERMANN:
            if (!g.vessel_type) throw MissingParameter("vessel_type", "Blendermann");
            return;
        case CoefficientModel::ISHERWOOD:
            if (!g.superstructure_area) throw MissingParameter("superstructure_area", "Isherwood");
            if (!g.breadth) throw MissingParameter("breadth", "Isherwood");
            if (!g.S) throw MissingParameter("S", "Isherwood");
            if (!g.masts) throw MissingParameter("masts", "Isherwood");
            return;
    }
    throw std::invalid_argument("Unknown coefficient model");
}

static WindCoefficients dispatch(CoefficientModel model, const VesselGeometry& g,
                                 double angle_of_attack) {
    switch (model) {
        case CoefficientModel::BLENDERMANN:
            return blendermannCoefficients(*g.vessel_type, g.frontal_area, g.lateral_area,
                                           g.Loa, g.s_L, angle_of_attack);
        case CoefficientModel::ISHERWOOD:
            return isherwoodCoefficients(g.frontal_area, g.lateral_area, *g.superstructure_area,
                                         g.Loa, *g.breadth, *g.S, g.s_L, *g.masts,
                                         angle_of_attack);
    }
    throw std::invalid_argument("Unknown coefficient model");
}

WindCoefficients computeWindCoefficients(CoefficientModel model, const VesselGeometry& geometry,
                                         double angle_of_attack) {
    validateGeometry(geometry);
    requireModelFields(model, geometry);
    return dispatch(model, geometry, angle_of_attack);
}

std::vector<WindCoefficients> sweepWindCoefficients(CoefficientModel model,
                                                    const VesselGeometry& geometry,
                                                    const std::vector<double>& angles_of_attack) {
    validateGeometry(geometry);
    requireModelFields(model, geometry);

    std::vector<WindCoefficients> result;
    result.reserve(angles_of_attack.size());
    for (double angle : angles_of_attack) {
        result.push_back(dispatch(model, geometry, angle));
    }
    return result;
}

} // namespace wind
} // namespace marcyb
