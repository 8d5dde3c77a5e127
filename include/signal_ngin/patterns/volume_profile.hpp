// include/signal_ngin/patterns/volume_profile.hpp
#pragma once

#include <string>
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/indicators/indicator_result.hpp"

namespace signal_ngin {
namespace patterns {

using indicators::IndicatorResult;

enum class VolumeProfileType { CONFIRMING_UP, CONFIRMING_DOWN, DIVERGING, NEUTRAL };

inline std::string to_string(VolumeProfileType type) {
    switch (type) {
        case VolumeProfileType::CONFIRMING_UP:
            return "confirming_up";
        case VolumeProfileType::CONFIRMING_DOWN:
            return "confirming_down";
        case VolumeProfileType::DIVERGING:
            return "diverging";
        default:
            return "neutral";
    }
}

struct VolumeProfile {
    VolumeProfileType type{VolumeProfileType::NEUTRAL};
    double ratio{1.0};     // Mean volume of the trailing window over the window before it
    int buy_pressure{50};  // Percent of trailing volume on up candles (close >= open)
};

/**
 * @brief Check whether volume confirms the recent price move
 *
 * confirming_up needs a rising window, buy pressure above 55% and ratio above 1.1;
 * confirming_down mirrors it. A rising window with buy pressure below 45% (or a
 * falling one above 55%) is diverging. Everything else is neutral.
 *
 * @param candles OHLCV candles, oldest first
 * @param lookback Window length
 * @return Neutral, ratio 1, buy pressure 50 tagged INSUFFICIENT with fewer than
 *         lookback + 1 candles
 */
IndicatorResult<VolumeProfile> analyze_volume_profile(const CandleSeries& candles,
                                                      int lookback = 14);

}  // namespace patterns
}  // namespace signal_ngin
