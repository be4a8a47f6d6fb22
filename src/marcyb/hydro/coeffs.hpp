#pragma once

namespace marcyb {
namespace hydro {

/**
 * @brief Block coefficient at an arbitrary draught (Riddlesworth)
 * @param cb_des Block coefficient at design draught
 * @param d_des Design draught [m]
 * @param d Draught to extrapolate to [m]
 * @return Block coefficient at draught d
 */
double blockCoefficientExtrapolation(double cb_des, double d_des, double d);

/**
 * @brief Fineness ratio L / displacement^(1/3)
 * @param lwl Length in the waterline [m]
 * @param displacement Displacement [metric tons]
 */
double finenessRatio(double lwl, double displacement);

} // namespace hydro
} // namespace marcyb
