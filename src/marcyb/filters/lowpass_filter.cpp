#include "marcyb/filters/lowpass_filter.hpp"
#include "marcyb/logging.hpp"
#include <stdexcept>

namespace marcyb {
namespace filters {

std::vector<double> lowpassFilter(const std::vector<double>& input_series, double time_constant) {
    if (input_series.empty()) {
        throw std::invalid_argument("lowpassFilter: input series is empty");
    }
    if (!(time_constant > 0.0)) {
        throw std::invalid_argument("lowpassFilter: time constant must be positive");
    }
    if (time_constant < 1.0) {
        logger()->warn("lowpassFilter: time constant {} < 1 gives a negative feedback gain", time_constant);
    }

    const double B = 1.0 / time_constant;
    const double A = 1.0 - B;

    std::vector<double> output_series;
    output_series.reserve(input_series.size() + 1);
    output_series.push_back(input_series.front());

    for (double unfiltered : input_series) {
        output_series.push_back(A * output_series.back() + B * unfiltered);
    }
    return output_series;
}

} // namespace filters
} // namespace marcyb
