#include <iostream>
#include <iomanip>
#include <fstream>
#include <string>
#include <algorithm>
#include "marcyb/logging.hpp"
#include "marcyb/waves/wave_spectrum.hpp"
#include "marcyb/wind/wind_spectrum.hpp"

using namespace marcyb;

static void writeCsv(const std::string& filename, const Spectrum& s) {
    std::ofstream csv(filename);
    if (!csv) {
        logger()->error("Cannot open {} for writing", filename);
        return;
    }
    csv << "frequency,density\n";
    for (std::size_t i = 0; i < s.frequencies.size(); ++i) {
        csv << s.frequencies[i] << "," << s.density[i] << "\n";
    }
}

static void printPeak(const std::string& name, const Spectrum& s) {
    auto peak = std::max_element(s.density.begin(), s.density.end());
    const auto i = static_cast<std::size_t>(peak - s.density.begin());
    std::cout << std::setw(18) << std::left << name << std::right
              << " samples: " << std::setw(5) << s.frequencies.size()
              << "  peak at " << s.frequencies[i] << " (" << *peak << ")" << std::endl;
}

int main(int argc, char** argv) {
    const double U_10 = argc > 1 ? std::stod(argv[1]) : 10.0;

    setLogLevel(spdlog::level::info);
    std::cout << "=== Wind and Wave Spectra (U_10 = " << U_10 << " m/s) ===" << std::endl;
    std::cout << std::fixed << std::setprecision(4);

    try {
        std::cout << "\n--- Wind gust spectra [Hz] ---" << std::endl;
        const Spectrum dav = wind::davenport(U_10);
        const Spectrum har = wind::harris(U_10);
        const Spectrum ochi = wind::ochiShin(U_10);
        const Spectrum np = wind::npd(U_10);
        const Spectrum ap = wind::api(U_10);
        printPeak("Davenport", dav);
        printPeak("Harris", har);
        printPeak("Ochi-Shin", ochi);
        printPeak("NPD", np);
        printPeak("API", ap);

        std::cout << "U(z = 50 m) [m/s]: " << wind::u10ToUz(U_10, 0.0025, 50.0) << std::endl;

        std::cout << "\n--- Wave spectra [rad/s] ---" << std::endl;
        const Spectrum pm = waves::piersonMoskowitz(U_10);
        const Spectrum js = waves::jonswap(U_10);
        printPeak("Pierson-Moskowitz", pm);
        printPeak("JONSWAP", js);

        writeCsv("wind_spectrum_davenport.csv", dav);
        writeCsv("wind_spectrum_harris.csv", har);
        writeCsv("wind_spectrum_ochi_shin.csv", ochi);
        writeCsv("wind_spectrum_npd.csv", np);
        writeCsv("wind_spectrum_api.csv", ap);
        writeCsv("wave_spectrum_pierson_moskowitz.csv", pm);
        writeCsv("wave_spectrum_jonswap.csv", js);
    } catch (const std::exception& e) {
        logger()->error("{}", e.what());
        return 1;
    }

    logger()->info("Spectra written to CSV");
    return 0;
}
