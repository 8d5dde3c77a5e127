// include/signal_ngin/patterns/ema_trend.hpp
#pragma once

#include <string>
#include "signal_ngin/indicators/indicator_result.hpp"
#include "signal_ngin/indicators/moving_averages.hpp"

namespace signal_ngin {
namespace patterns {

using indicators::IndicatorResult;
using indicators::Series;

enum class EmaTrendType { STRONG_UP, UP, SIDEWAYS, DOWN, STRONG_DOWN, UNKNOWN };

inline std::string to_string(EmaTrendType type) {
    switch (type) {
        case EmaTrendType::STRONG_UP:
            return "strong_up";
        case EmaTrendType::UP:
            return "up";
        case EmaTrendType::SIDEWAYS:
            return "sideways";
        case EmaTrendType::DOWN:
            return "down";
        case EmaTrendType::STRONG_DOWN:
            return "strong_down";
        default:
            return "unknown";
    }
}

inline bool is_uptrend(EmaTrendType type) {
    return type == EmaTrendType::STRONG_UP || type == EmaTrendType::UP;
}

inline bool is_downtrend(EmaTrendType type) {
    return type == EmaTrendType::STRONG_DOWN || type == EmaTrendType::DOWN;
}

struct EmaTrend {
    EmaTrendType type{EmaTrendType::UNKNOWN};
    double strength{0.0};
    double ema9{0.0};
    double ema21{0.0};
    double ema50{0.0};
};

/**
 * @brief Classify the trend from the alignment of EMA 9, 21 and 50
 *
 * strong_up:   price > ema9 > ema21 > ema50, strength min(10 * sep%, 100) where
 *              sep% is the ema9/ema50 separation in percent of ema50
 * up:          price > ema21 and ema9 > ema21, strength 50
 * sideways:    anything else, strength 20
 * The bearish labels mirror the bullish ones.
 *
 * @param prices Closing prices, oldest first
 * @return UNKNOWN with strength 0 tagged INSUFFICIENT below 50 prices
 */
IndicatorResult<EmaTrend> detect_ema_trend(const Series& prices);

}  // namespace patterns
}  // namespace signal_ngin
