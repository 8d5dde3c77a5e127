// include/signal_ngin/indicators/support_resistance.hpp
#pragma once

#include "signal_ngin/core/types.hpp"
#include "signal_ngin/indicators/indicator_result.hpp"
#include "signal_ngin/indicators/moving_averages.hpp"

namespace signal_ngin {
namespace indicators {

/**
 * @brief Classic pivot levels
 * pivot = (H + L + C) / 3, resistance = 2 * pivot - L, support = 2 * pivot - H
 */
struct PivotLevels {
    double support{0.0};
    double resistance{0.0};
    double pivot{0.0};
};

/**
 * @brief Pivot levels from the highest high and lowest low of the trailing window
 * @param candles OHLC candles, oldest first
 * @param window Number of trailing candles considered
 * @return Levels, or support/resistance at -5%/+5% of the last close tagged
 *         INSUFFICIENT with fewer than 3 candles
 */
IndicatorResult<PivotLevels> support_resistance(const CandleSeries& candles, int window = 30);

/**
 * @brief Pivot levels for close-only history (H and L are the extreme closes)
 */
IndicatorResult<PivotLevels> support_resistance_from_closes(const Series& prices);

}  // namespace indicators
}  // namespace signal_ngin
