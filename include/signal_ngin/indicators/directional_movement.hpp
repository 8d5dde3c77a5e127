// include/signal_ngin/indicators/directional_movement.hpp
#pragma once

#include <string>
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/indicators/indicator_result.hpp"

namespace signal_ngin {
namespace indicators {

enum class AdxTrend { STRONG_UP, STRONG_DOWN, WEAK_UP, WEAK_DOWN, RANGING, NONE };

inline std::string to_string(AdxTrend trend) {
    switch (trend) {
        case AdxTrend::STRONG_UP:
            return "strong_up";
        case AdxTrend::STRONG_DOWN:
            return "strong_down";
        case AdxTrend::WEAK_UP:
            return "weak_up";
        case AdxTrend::WEAK_DOWN:
            return "weak_down";
        case AdxTrend::RANGING:
            return "ranging";
        default:
            return "none";
    }
}

/**
 * @brief ADX reading, values rounded to one decimal
 */
struct AdxResult {
    double adx{0.0};
    double plus_di{0.0};
    double minus_di{0.0};
    AdxTrend trend{AdxTrend::NONE};
};

/**
 * @brief Average Directional Index with +DI/-DI
 *
 * True range, +DM and -DM are seeded with their mean over the first `period`
 * samples and Wilder-smoothed afterwards. DX is computed from every smoothed
 * sample after the seed and ADX is the Wilder-smoothed DX. The trend label uses
 * the unrounded ADX: >= 25 strong, >= 20 weak (direction from the dominant DI of
 * the last sample), otherwise ranging.
 *
 * @param candles OHLC candles, oldest first
 * @param period Smoothing period
 * @return {0, 0, 0, NONE} tagged INSUFFICIENT when fewer than `period` DX values
 *         can be formed (at least 2 * period + 1 candles are needed)
 */
IndicatorResult<AdxResult> adx(const CandleSeries& candles, int period = 14);

}  // namespace indicators
}  // namespace signal_ngin
