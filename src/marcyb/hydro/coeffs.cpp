#include "marcyb/hydro/coeffs.hpp"
#include <cmath>
#include <stdexcept>

namespace marcyb {
namespace hydro {

double blockCoefficientExtrapolation(double cb_des, double d_des, double d) {
    if (!(d_des > 0.0) || !(d > 0.0)) {
        throw std::invalid_argument("blockCoefficientExtrapolation: draughts must be positive");
    }
    return 1.0 - (1.0 - cb_des) * std::cbrt(d_des / d);
}

double finenessRatio(double lwl, double displacement) {
    if (!(lwl > 0.0) || !(displacement > 0.0)) {
        throw std::invalid_argument("finenessRatio: length and displacement must be positive");
    }
    return lwl / std::cbrt(displacement);
}

} // namespace hydro
} // namespace marcyb
