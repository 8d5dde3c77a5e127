// include/signal_ngin/indicators/momentum.hpp
#pragma once

#include <string>
#include <vector>
#include "signal_ngin/indicators/indicator_result.hpp"
#include "signal_ngin/indicators/moving_averages.hpp"

namespace signal_ngin {
namespace indicators {

/**
 * @brief Direction of the MACD histogram over its last samples
 */
enum class MacdTrend {
    GROWING,    // Last histogram value above the third-from-last
    SHRINKING,  // Otherwise
    NEUTRAL     // Fewer than three histogram values
};

inline std::string to_string(MacdTrend trend) {
    switch (trend) {
        case MacdTrend::GROWING:
            return "growing";
        case MacdTrend::SHRINKING:
            return "shrinking";
        default:
            return "neutral";
    }
}

struct MacdResult {
    double macd{0.0};
    double signal{0.0};
    double histogram{0.0};  // macd - signal
    Series histogram_series;
    MacdTrend histogram_trend{MacdTrend::NEUTRAL};
};

/**
 * @brief Relative Strength Index with Wilder smoothing
 *
 * Average gain and loss are seeded with the mean of the first `period` deltas and
 * then smoothed as avg = (avg * (period - 1) + x) / period. When the average loss is
 * zero the RSI is 100, which includes a perfectly flat series.
 *
 * @param prices Closing prices, oldest first
 * @param period Lookback period
 * @return RSI in [0, 100], or 50 tagged INSUFFICIENT with fewer than period + 1 prices
 */
IndicatorResult<double> rsi(const Series& prices, int period = 14);

/**
 * @brief RSI trail, one value per price from index `period` onward
 * The last element equals rsi(prices, period).
 */
IndicatorResult<Series> rsi_series(const Series& prices, int period = 14);

/**
 * @brief Moving Average Convergence Divergence
 *
 * macd_line[i] = ema_fast[i + slow - fast] - ema_slow[i], signal = ema(macd_line).
 * Below `slow` prices every field is zero, the histogram series is empty and the
 * trend is NEUTRAL.
 *
 * @param prices Closing prices, oldest first
 * @param fast_period Fast EMA period
 * @param slow_period Slow EMA period
 * @param signal_period Signal EMA period
 */
IndicatorResult<MacdResult> macd(const Series& prices, int fast_period = 12,
                                 int slow_period = 26, int signal_period = 9);

}  // namespace indicators
}  // namespace signal_ngin
