// include/signal_ngin/indicators/volatility.hpp
#pragma once

#include "signal_ngin/core/types.hpp"
#include "signal_ngin/indicators/indicator_result.hpp"
#include "signal_ngin/indicators/moving_averages.hpp"

namespace signal_ngin {
namespace indicators {

struct BollingerBands {
    double upper{0.0};
    double middle{0.0};
    double lower{0.0};
    double bandwidth{0.0};  // (upper - lower) / middle * 100
    double percent_b{0.5};  // (price - lower) / (upper - lower)
};

/**
 * @brief Bollinger Bands over the trailing window, population standard deviation
 *
 * percent_b is 0.5 when the bands have zero width. With fewer than `period` prices
 * the bands collapse onto the last price (0 for an empty series).
 *
 * @param prices Closing prices, oldest first
 * @param period Window length
 * @param std_dev Band width in standard deviations
 */
IndicatorResult<BollingerBands> bollinger_bands(const Series& prices, int period = 20,
                                                double std_dev = 2.0);

/**
 * @brief Bollinger bandwidth of one window, 0 when its mean is 0
 */
double bandwidth_of_window(const double* first, int period, double std_dev = 2.0);

/**
 * @brief max(high - low, |high - prev_close|, |low - prev_close|)
 */
double true_range(const Candle& current, const Candle& previous);

/**
 * @brief Average True Range as the simple mean of the last `period` true ranges
 * @return 0 tagged INSUFFICIENT with fewer than period + 1 candles
 */
IndicatorResult<double> atr(const CandleSeries& candles, int period = 14);

}  // namespace indicators
}  // namespace signal_ngin
