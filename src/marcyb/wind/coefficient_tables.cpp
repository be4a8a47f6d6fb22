#include "marcyb/wind/coefficient_tables.hpp"
#include "marcyb/errors.hpp"
#include "marcyb/logging.hpp"
#include "marcyb/utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace marcyb {
namespace wind {

const std::vector<BlendermannRow> CoefficientTables::kBlendermann = {
    // type                               CDt   CDl(0) CDl(pi) delta kappa
    {"Car carrier",                      0.95,  0.55,  0.60,  0.80,  1.2},
    {"Cargo vessel, loaded",             0.85,  0.65,  0.55,  0.40,  1.7},
    {"Cargo vessel, container on deck",  0.85,  0.55,  0.50,  0.40,  1.4},
    {"Container ship, loaded",           0.90,  0.55,  0.55,  0.40,  1.4},
    {"Destroyer",                        0.85,  0.60,  0.65,  0.65,  1.1},
    {"Diving support vessel",            0.90,  0.60,  0.80,  0.55,  1.7},
    {"Drilling vessel",                  1.00,  0.85,  0.92,  0.10,  1.7},
    {"Ferry",                            0.90,  0.45,  0.50,  0.80,  1.1},
    {"Fishing vessel",                   0.95,  0.70,  0.70,  0.40,  1.1},
    {"Liquefied natural gas tanker",     0.70,  0.60,  0.65,  0.50,  1.1},
    {"Offshore supply vessel",           0.90,  0.55,  0.80,  0.55,  1.2},
    {"Passenger liner",                  0.90,  0.40,  0.40,  0.80,  1.2},
    {"Research vessel",                  0.85,  0.55,  0.65,  0.60,  1.4},
    {"Speed boat",                       0.90,  0.55,  0.60,  0.60,  1.1},
    {"Tanker, loaded",                   0.70,  0.90,  0.55,  0.40,  3.1},
    {"Tanker, in ballast",               0.70,  0.75,  0.55,  0.40,  2.2},
    {"Tender",                           0.85,  0.55,  0.55,  0.65,  1.1}
};

const std::vector<IsherwoodBreakpoint> CoefficientTables::kIsherwoodSurge = {
    // angle      A0       A1       A2       A3       A4      A5      A6
    {  0.0, { 2.1520, -5.000,  0.2430, -0.1640,  0.0000,  0.000,  0.000}},
    { 10.0, { 1.7140, -3.330,  0.1450, -0.1210,  0.0000,  0.000,  0.000}},
    { 20.0, { 1.8180, -3.970,  0.2110, -0.1430,  0.0000,  0.000,  0.033}},
    { 30.0, { 1.9650, -4.810,  0.2430, -0.1540,  0.0000,  0.000,  0.041}},
    { 40.0, { 2.3330, -5.990,  0.2470, -0.1900,  0.0000,  0.000,  0.042}},
    { 50.0, { 1.7260, -6.540,  0.1890, -0.1730,  0.3480,  0.000,  0.048}},
    { 60.0, { 0.9130, -4.680,  0.0000, -0.1040,  0.4820,  0.000,  0.052}},
    { 70.0, { 0.4570, -2.880,  0.0000, -0.0680,  0.3460,  0.000,  0.043}},
    { 80.0, { 0.3410, -0.910,  0.0000, -0.0310,  0.0000,  0.000,  0.032}},
    { 90.0, { 0.3550,  0.000,  0.0000,  0.0000, -0.2470,  0.000,  0.018}},
    {100.0, { 0.6010,  0.000,  0.0000,  0.0000, -0.3720,  0.000, -0.020}},
    {110.0, { 0.6510,  1.290,  0.0000,  0.0000, -0.5820,  0.000, -0.031}},
    {120.0, { 0.5640,  2.540,  0.0000,  0.0000, -0.7480,  0.000, -0.024}},
    {130.0, {-0.1420,  3.580,  0.0000,  0.0470, -0.7000,  0.000, -0.028}},
    {140.0, {-0.6770,  3.640,  0.0000,  0.0690, -0.5290,  0.000, -0.032}},
    {150.0, {-0.7230,  3.140,  0.0000,  0.0640, -0.4750,  0.000, -0.032}},
    {160.0, {-2.1480,  2.560,  0.0000,  0.0810,  0.0000,  1.270, -0.027}},
    {170.0, {-2.7070,  3.970, -0.1750,  0.1260,  0.0000,  1.810,  0.000}},
    {180.0, {-2.5290,  3.760, -0.1740,  0.1280,  0.0000,  1.550,  0.000}}
};

const std::vector<IsherwoodBreakpoint> CoefficientTables::kIsherwoodSway = {
    // angle      B0       B1       B2       B3       B4      B5      B6
    {  0.0, { 0.0000,  0.000,  0.0000,  0.0000,  0.0000,  0.000,  0.000}},
    { 10.0, { 0.0960,  0.220,  0.0000,  0.0000,  0.0000,  0.000,  0.000}},
    { 20.0, { 0.1760,  0.710,  0.0000,  0.0000,  0.0000,  0.000,  0.000}},
    { 30.0, { 0.2250,  1.380,  0.0000,  0.0230,  0.0000, -0.290,  0.000}},
    { 40.0, { 0.3290,  1.820,  0.0000,  0.0430,  0.0000, -0.590,  0.000}},
    { 50.0, { 1.1640,  1.260,  0.1210,  0.0000, -0.2420, -0.950,  0.000}},
    { 60.0, { 1.1630,  0.960,  0.1010,  0.0000, -0.1770, -0.880,  0.000}},
    { 70.0, { 0.9160,  0.530,  0.0690,  0.0000,  0.0000, -0.650,  0.000}},
    { 80.0, { 0.8440,  0.550,  0.0820,  0.0000,  0.0000, -0.540,  0.000}},
    { 90.0, { 0.8890,  0.000,  0.1380,  0.0000,  0.0000, -0.660,  0.000}},
    {100.0, { 0.7990,  0.000,  0.1550,  0.0000,  0.0000, -0.550,  0.000}},
    {110.0, { 0.7970,  0.000,  0.1510,  0.0000,  0.0000, -0.550,  0.000}},
    {120.0, { 0.9960,  0.000,  0.1840,  0.0000, -0.2120, -0.660,  0.340}},
    {130.0, { 1.0140,  0.000,  0.1910,  0.0000, -0.2800, -0.690,  0.440}},
    {140.0, { 0.7840,  0.000,  0.1660,  0.0000, -0.2090, -0.530,  0.380}},
    {150.0, { 0.5360,  0.000,  0.1760, -0.0290, -0.1630,  0.000,  0.270}},
    {160.0, { 0.2510,  0.000,  0.1060, -0.0220,  0.0000,  0.000,  0.000}},
    {170.0, { 0.1250,  0.000,  0.0460, -0.0120,  0.0000,  0.000,  0.000}},
    {180.0, { 0.0000,  0.000,  0.0000,  0.0000,  0.0000,  0.000,  0.000}}
};

const std::vector<IsherwoodBreakpoint> CoefficientTables::kIsherwoodYaw = {
    // angle      C0       C1       C2       C3       C4      C5
    {  0.0, { 0.0000,  0.000,  0.0000,  0.0000,  0.0000,  0.000,  0.0}},
    { 10.0, { 0.0596,  0.061,  0.0000,  0.0000,  0.0000, -0.074,  0.0}},
    { 20.0, { 0.1106,  0.204,  0.0000,  0.0000,  0.0000, -0.170,  0.0}},
    { 30.0, { 0.2258,  0.245,  0.0000,  0.0000,  0.0000, -0.380,  0.0}},
    { 40.0, { 0.2017,  0.457,  0.0000,  0.0067,  0.0000, -0.472,  0.0}},
    { 50.0, { 0.1759,  0.573,  0.0000,  0.0118,  0.0000, -0.523,  0.0}},
    { 60.0, { 0.1925,  0.480,  0.0000,  0.0115,  0.0000, -0.546,  0.0}},
    { 70.0, { 0.2133,  0.315,  0.0000,  0.0081,  0.0000, -0.526,  0.0}},
    { 80.0, { 0.1827,  0.254,  0.0000,  0.0053,  0.0000, -0.443,  0.0}},
    { 90.0, { 0.2627,  0.000,  0.0000,  0.0000,  0.0000, -0.508,  0.0}},
    {100.0, { 0.2102,  0.000, -0.0195,  0.0000,  0.0335, -0.492,  0.0}},
    {110.0, { 0.1567,  0.000, -0.0258,  0.0000,  0.0497, -0.457,  0.0}},
    {120.0, { 0.0801,  0.000, -0.0311,  0.0000,  0.0740, -0.396,  0.0}},
    {130.0, {-0.0189,  0.000, -0.0488,  0.0101,  0.1128, -0.420,  0.0}},
    {140.0, { 0.0256,  0.000, -0.0422,  0.0100,  0.0889, -0.463,  0.0}},
    {150.0, { 0.0552,  0.000, -0.0381,  0.0109,  0.0689, -0.476,  0.0}},
    {160.0, { 0.0881,  0.000, -0.0306,  0.0091,  0.0366, -0.415,  0.0}},
    {170.0, { 0.0851,  0.000, -0.0122,  0.0025,  0.0000, -0.220,  0.0}},
    {180.0, { 0.0000,  0.000,  0.0000,  0.0000,  0.0000,  0.000,  0.0}}
};

const std::vector<BlendermannRow>& CoefficientTables::blendermann() {
    return kBlendermann;
}

const BlendermannRow& CoefficientTables::lookupBlendermann(const std::string& vessel_type) {
    auto it = std::find_if(kBlendermann.begin(), kBlendermann.end(),
                           [&vessel_type](const BlendermannRow& row) { return row.name == vessel_type; });
    if (it == kBlendermann.end()) {
        throw UnknownVesselType(vessel_type);
    }
    return *it;
}

const std::vector<IsherwoodBreakpoint>& CoefficientTables::isherwood(IsherwoodTable table) {
    switch (table) {
        case IsherwoodTable::SURGE:
            return kIsherwoodSurge;
        case IsherwoodTable::SWAY:
            return kIsherwoodSway;
        case IsherwoodTable::YAW:
            return kIsherwoodYaw;
    }
    throw std::invalid_argument("Unknown Isherwood table");
}

int CoefficientTables::columnCount(IsherwoodTable table) {
    return table == IsherwoodTable::YAW ? 6 : 7;
}

Eigen::VectorXd CoefficientTables::interpolateIsherwood(IsherwoodTable table, double angle_deg) {
    if (!std::isfinite(angle_deg)) {
        throw std::invalid_argument("Isherwood interpolation: angle of attack must be finite");
    }

    const std::vector<IsherwoodBreakpoint>& rows = isherwood(table);
    const int n_cols = columnCount(table);
    Eigen::VectorXd coefficients(n_cols);

    auto copyRow = [&](const IsherwoodBreakpoint& row) {
        for (int i = 0; i < n_cols; ++i) {
            coefficients(i) = row.coefficients[i];
        }
    };

    // Clamp at the edges of the table
    if (angle_deg <= ISHERWOOD_MIN_ANGLE) {
        if (angle_deg < ISHERWOOD_MIN_ANGLE) {
            logger()->debug("Isherwood angle {:.3f} deg below table, clamped to {:.1f} deg",
                            angle_deg, ISHERWOOD_MIN_ANGLE);
        }
        copyRow(rows.front());
        return coefficients;
    }
    if (angle_deg >= ISHERWOOD_MAX_ANGLE) {
        if (angle_deg > ISHERWOOD_MAX_ANGLE) {
            logger()->debug("Isherwood angle {:.3f} deg above table, clamped to {:.1f} deg",
                            angle_deg, ISHERWOOD_MAX_ANGLE);
        }
        copyRow(rows.back());
        return coefficients;
    }

    // First row with angle > angle_deg; never begin() or end() after the clamps above
    auto upper = std::upper_bound(rows.begin(), rows.end(), angle_deg,
                                  [](double a, const IsherwoodBreakpoint& row) { return a < row.angle_deg; });
    const IsherwoodBreakpoint& hi = *upper;
    const IsherwoodBreakpoint& lo = *(upper - 1);

    if (angle_deg == lo.angle_deg) {
        copyRow(lo);
        return coefficients;
    }

    const double t = (angle_deg - lo.angle_deg) / (hi.angle_deg - lo.angle_deg);
    for (int i = 0; i < n_cols; ++i) {
        coefficients(i) = math::lerp(t, lo.coefficients[i], hi.coefficients[i]);
    }
    return coefficients;
}

} // namespace wind
} // namespace marcyb
