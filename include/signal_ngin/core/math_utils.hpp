// include/signal_ngin/core/math_utils.hpp
#pragma once

#include <cmath>

namespace signal_ngin {
namespace core {

/**
 * @brief Round to the nearest integer, halves towards positive infinity
 * (-2.5 -> -2, 2.5 -> 3)
 */
inline double round_half_up(double value) {
    return std::floor(value + 0.5);
}

/**
 * @brief Round to a fixed number of decimals, halves towards positive infinity
 */
inline double round_to_decimals(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return round_half_up(value * scale) / scale;
}

}  // namespace core
}  // namespace signal_ngin
