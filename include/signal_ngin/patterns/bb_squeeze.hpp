// include/signal_ngin/patterns/bb_squeeze.hpp
#pragma once

#include <string>
#include "signal_ngin/indicators/indicator_result.hpp"
#include "signal_ngin/indicators/moving_averages.hpp"

namespace signal_ngin {
namespace patterns {

using indicators::IndicatorResult;
using indicators::Series;

enum class BreakoutDirection { UP, DOWN, NONE };

inline std::string to_string(BreakoutDirection direction) {
    switch (direction) {
        case BreakoutDirection::UP:
            return "up";
        case BreakoutDirection::DOWN:
            return "down";
        default:
            return "none";
    }
}

struct BbSqueeze {
    bool squeeze{false};
    BreakoutDirection direction{BreakoutDirection::NONE};
    double bandwidth{0.0};      // Bandwidth of the last window
    double avg_bandwidth{0.0};  // Mean bandwidth of the last 20 windows
};

/**
 * @brief Detect a Bollinger squeeze and the likely breakout direction
 *
 * The squeeze fires when the current bandwidth is below 70% of the mean of the
 * last 20 bandwidth samples. The direction is UP when the last close is above the
 * close four bars earlier, DOWN otherwise.
 *
 * @param prices Closing prices, oldest first
 * @param period Bollinger window length
 * @return No squeeze, direction NONE tagged INSUFFICIENT below period + 20 prices
 */
IndicatorResult<BbSqueeze> detect_bb_squeeze(const Series& prices, int period = 20);

}  // namespace patterns
}  // namespace signal_ngin
