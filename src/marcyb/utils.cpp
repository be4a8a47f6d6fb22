#include "marcyb/utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace marcyb {
namespace math {

double lerp(double t, double start, double end) {
    return start + t * (end - start);
}

double clamp(double value, double min_val, double max_val) {
    return std::max(min_val, std::min(max_val, value));
}

std::vector<double> arange(double start, double stop, double step) {
    if (!(step > 0.0)) {
        throw std::invalid_argument("arange: step must be positive");
    }

    std::vector<double> values;
    if (stop <= start) {
        return values;
    }

    const auto n = static_cast<std::size_t>(std::ceil((stop - start) / step));
    values.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        values.push_back(start + static_cast<double>(i) * step);
    }
    return values;
}

} // namespace math
} // namespace marcyb
