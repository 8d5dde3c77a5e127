// src/patterns/volume_profile.cpp

#include "signal_ngin/patterns/volume_profile.hpp"
#include "signal_ngin/core/math_utils.hpp"

namespace signal_ngin {
namespace patterns {

IndicatorResult<VolumeProfile> analyze_volume_profile(const CandleSeries& candles, int lookback) {
    if (lookback <= 0 || candles.size() < static_cast<size_t>(lookback) + 1) {
        return IndicatorResult<VolumeProfile>::insufficient();
    }

    const size_t recent_begin = candles.size() - lookback;
    const size_t older_begin =
        candles.size() >= 2 * static_cast<size_t>(lookback) ? candles.size() - 2 * lookback : 0;
    const size_t older_count = recent_begin - older_begin;

    double recent_volume = 0.0;
    double up_volume = 0.0;
    double down_volume = 0.0;
    for (size_t i = recent_begin; i < candles.size(); ++i) {
        const Candle& c = candles[i];
        recent_volume += c.volume;
        if (c.close >= c.open) {
            up_volume += c.volume;
        } else {
            down_volume += c.volume;
        }
    }

    double older_volume = 0.0;
    for (size_t i = older_begin; i < recent_begin; ++i) {
        older_volume += candles[i].volume;
    }

    const double recent_avg = recent_volume / lookback;
    const double older_avg = older_volume / older_count;

    VolumeProfile profile;
    profile.ratio = older_avg > 0 ? recent_avg / older_avg : 1.0;

    const double price_move = candles.back().close - candles[recent_begin].close;
    const double total = up_volume + down_volume;
    const double pressure = total > 0 ? up_volume / total : 0.5;
    profile.buy_pressure = static_cast<int>(core::round_half_up(pressure * 100));

    if (price_move > 0 && pressure > 0.55 && profile.ratio > 1.1) {
        profile.type = VolumeProfileType::CONFIRMING_UP;
    } else if (price_move < 0 && pressure < 0.45 && profile.ratio > 1.1) {
        profile.type = VolumeProfileType::CONFIRMING_DOWN;
    } else if ((price_move > 0 && pressure < 0.45) || (price_move < 0 && pressure > 0.55)) {
        profile.type = VolumeProfileType::DIVERGING;
    }

    return IndicatorResult<VolumeProfile>::sufficient(profile);
}

}  // namespace patterns
}  // namespace signal_ngin
