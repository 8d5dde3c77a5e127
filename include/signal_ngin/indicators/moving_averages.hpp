// include/signal_ngin/indicators/moving_averages.hpp
#pragma once

#include <vector>
#include "signal_ngin/indicators/indicator_result.hpp"

namespace signal_ngin {
namespace indicators {

using Series = std::vector<double>;

/**
 * @brief Simple moving average
 * @param series Input values, oldest first
 * @param period Window length
 * @return One mean per complete window (size - period + 1 values), empty and
 *         INSUFFICIENT when the series is shorter than the period
 */
IndicatorResult<Series> sma(const Series& series, int period);

/**
 * @brief Exponential moving average seeded with the SMA of the first window
 *
 * k = 2 / (period + 1), ema[i] = value[i] * k + ema[i - 1] * (1 - k).
 * A single-element series yields that element whatever the period.
 *
 * @param series Input values, oldest first
 * @param period Smoothing period
 * @return size - period + 1 values, empty and INSUFFICIENT when too short
 */
IndicatorResult<Series> ema(const Series& series, int period);

}  // namespace indicators
}  // namespace signal_ngin
