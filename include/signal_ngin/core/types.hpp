// include/signal_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace signal_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 * Used for all price-related calculations
 */
using Price = double;

/**
 * @brief One OHLCV interval of a tradable asset
 * Expected to satisfy low <= {open, close} <= high and volume >= 0
 */
struct Candle {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    Candle() = default;
    Candle(Timestamp ts, Price o, Price h, Price l, Price c, double v)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v) {}
};

/**
 * @brief Candles ordered by ascending timestamp
 */
using CandleSeries = std::vector<Candle>;

/**
 * @brief Extract closing prices from a candle series
 * @param candles Candle series
 * @return Close of every candle, in order
 */
inline std::vector<double> closes_of(const CandleSeries& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        closes.push_back(candle.close);
    }
    return closes;
}

}  // namespace signal_ngin
