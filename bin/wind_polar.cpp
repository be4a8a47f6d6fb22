#include <iostream>
#include <iomanip>
#include <fstream>
#include <string>
#include <vector>
#include "marcyb/config.hpp"
#include "marcyb/logging.hpp"
#include "marcyb/utils.hpp"
#include "marcyb/wind/wind_coefficients.hpp"
#include "marcyb/wind/wind_forces.hpp"

using namespace marcyb;

int main(int argc, char** argv) {
    const std::string case_file = argc > 1 ? argv[1] : "configs/offshore_supply_vessel.yaml";
    const std::string output_file = argc > 2 ? argv[2] : "wind_forces.csv";

    setLogLevel(spdlog::level::info);

    config::WindCase wc;
    try {
        wc = config::loadWindCase(case_file);
    } catch (const std::exception& e) {
        logger()->error("{}", e.what());
        return 1;
    }

    std::cout << "=== Wind Polar: " << wc.name << " ===" << std::endl;
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Model: " << toString(wc.model) << std::endl;
    std::cout << "Wind speed [m/s]: " << wc.wind_speed << std::endl;
    std::cout << "Air density [kg/m³]: " << wind::computeRhoW(wc.options.temperature) << std::endl;

    // 0 to 180 degrees, 0.1 degree resolution
    std::vector<double> directions;
    for (double deg : math::arange(0.0, 180.0 + 0.05, 0.1)) {
        directions.push_back(math::degToRad(deg));
    }

    std::vector<Vec3> loads;
    std::vector<WindCoefficients> coefficients;
    try {
        loads = wind::sweepWindForces(wc.wind_speed, directions, wc.geometry, wc.model, wc.options);
        std::vector<double> angles_of_attack;
        angles_of_attack.reserve(directions.size());
        for (double direction : directions) {
            angles_of_attack.push_back(
                wind::computeRelativeWind(wc.wind_speed, direction, wc.options).angle_of_attack);
        }
        coefficients = wind::sweepWindCoefficients(wc.model, wc.geometry, angles_of_attack);
    } catch (const std::exception& e) {
        logger()->error("Sweep failed: {}", e.what());
        return 1;
    }

    std::ofstream csv(output_file);
    if (!csv) {
        logger()->error("Cannot open {} for writing", output_file);
        return 1;
    }
    csv << "direction_deg,C_X,C_Y,C_N,F_surge_kN,F_sway_kN,M_yaw_kNm\n";
    for (std::size_t i = 0; i < directions.size(); ++i) {
        csv << math::radToDeg(directions[i]) << ","
            << coefficients[i].C_X << "," << coefficients[i].C_Y << "," << coefficients[i].C_N << ","
            << loads[i](0) << "," << loads[i](1) << "," << loads[i](2) << "\n";
    }

    // Headline directions
    std::cout << "\n--- Loads (surge kN, sway kN, yaw kNm) ---" << std::endl;
    for (int deg : {0, 45, 90, 135, 180}) {
        const std::size_t i = static_cast<std::size_t>(deg) * 10;
        std::cout << std::setw(4) << deg << " deg: " << loads[i].transpose() << std::endl;
    }

    logger()->info("Wrote {} rows to {}", directions.size(), output_file);
    return 0;
}
