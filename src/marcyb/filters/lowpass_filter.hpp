#pragma once

#include <vector>

namespace marcyb {
namespace filters {

/**
 * @brief First order low-pass filter of a time series
 *
 * y[k+1] = (1 - 1/tau) y[k] + (1/tau) x[k], seeded with y[0] = x[0].
 * The output holds the seed followed by one value per input sample, so it
 * is one element longer than the input.
 *
 * @param input_series Samples to filter
 * @param time_constant Filter time constant, in samples
 * @return Filtered series
 * @throws std::invalid_argument for an empty series or non-positive time constant
 */
std::vector<double> lowpassFilter(const std::vector<double>& input_series, double time_constant);

} // namespace filters
} // namespace marcyb
