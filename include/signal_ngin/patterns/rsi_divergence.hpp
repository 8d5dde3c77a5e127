// include/signal_ngin/patterns/rsi_divergence.hpp
#pragma once

#include <string>
#include "signal_ngin/indicators/indicator_result.hpp"
#include "signal_ngin/indicators/moving_averages.hpp"

namespace signal_ngin {
namespace patterns {

using indicators::IndicatorResult;
using indicators::Series;

enum class DivergenceType { BULLISH, BEARISH, NONE };

inline std::string to_string(DivergenceType type) {
    switch (type) {
        case DivergenceType::BULLISH:
            return "bullish";
        case DivergenceType::BEARISH:
            return "bearish";
        default:
            return "none";
    }
}

struct Divergence {
    DivergenceType type{DivergenceType::NONE};
    double strength{0.0};  // |RSI difference| between the two compared extremes
};

/**
 * @brief Detect a price/RSI divergence inside the trailing window
 *
 * The last `lookback` prices and RSI values are aligned on their final elements.
 * A local low is strictly below the two samples on each side; local highs mirror
 * it. Only the last two lows (bullish: lower price, higher RSI) and then the last
 * two highs (bearish: higher price, lower RSI) are compared, so at most one
 * divergence is reported.
 *
 * @param prices Closing prices, oldest first
 * @param rsi_series RSI trail of the same prices
 * @param lookback Window length
 * @return NONE tagged INSUFFICIENT when prices < lookback + 14 or the RSI trail is
 *         shorter than lookback
 */
IndicatorResult<Divergence> detect_rsi_divergence(const Series& prices, const Series& rsi_series,
                                                  int lookback = 20);

}  // namespace patterns
}  // namespace signal_ngin
