#pragma once

#include <Eigen/Dense>
#include <array>
#include <string>
#include <vector>

namespace marcyb {
namespace wind {

// One Blendermann (1994) vessel type.
struct BlendermannRow {
    std::string name;   // exact lookup key
    double CDt;         // transverse drag coefficient
    double CDl0;        // longitudinal drag coefficient, head wind
    double CDlpi;       // longitudinal drag coefficient, stern wind
    double delta;       // cross-force parameter
    double kappa;       // roll moment factor (not used by the force calculation)
};

// One Isherwood (1972) breakpoint: angle of attack and its regression
// coefficients. The yaw table only fills the first six columns.
struct IsherwoodBreakpoint {
    double angle_deg;
    std::array<double, 7> coefficients;
};

enum class IsherwoodTable {
    SURGE,      // A0..A6
    SWAY,       // B0..B6
    YAW         // C0..C5
};

class CoefficientTables {
public:
    static constexpr double ISHERWOOD_MIN_ANGLE = 0.0;      // deg
    static constexpr double ISHERWOOD_MAX_ANGLE = 180.0;    // deg

    /**
     * @brief All 17 Blendermann vessel types
     */
    static const std::vector<BlendermannRow>& blendermann();

    /**
     * @brief Find the Blendermann row whose name equals vessel_type exactly
     * @throws UnknownVesselType when no row matches
     */
    static const BlendermannRow& lookupBlendermann(const std::string& vessel_type);

    /**
     * @brief Breakpoint rows of one Isherwood table, ordered by angle
     */
    static const std::vector<IsherwoodBreakpoint>& isherwood(IsherwoodTable table);

    /**
     * @brief Number of regression coefficients of a table (7, 7 or 6)
     */
    static int columnCount(IsherwoodTable table);

    /**
     * @brief Interpolate every coefficient column of an Isherwood table
     *
     * Piecewise-linear between the two bracketing rows. Angles outside
     * [0, 180] are clamped to the first or last row; knots return the row
     * values exactly.
     *
     * @param table Surge, sway or yaw table
     * @param angle_deg Angle of attack [deg]
     * @return Coefficient vector of length columnCount(table)
     * @throws std::invalid_argument for non-finite angles
     */
    static Eigen::VectorXd interpolateIsherwood(IsherwoodTable table, double angle_deg);

private:
    static const std::vector<BlendermannRow> kBlendermann;
    static const std::vector<IsherwoodBreakpoint> kIsherwoodSurge;
    static const std::vector<IsherwoodBreakpoint> kIsherwoodSway;
    static const std::vector<IsherwoodBreakpoint> kIsherwoodYaw;
};

} // namespace wind
} // namespace marcyb
