// src/patterns/ema_trend.cpp

#include "signal_ngin/patterns/ema_trend.hpp"
#include <algorithm>

namespace signal_ngin {
namespace patterns {

namespace {
constexpr size_t MIN_TREND_PRICES = 50;
}

IndicatorResult<EmaTrend> detect_ema_trend(const Series& prices) {
    if (prices.size() < MIN_TREND_PRICES) {
        return IndicatorResult<EmaTrend>::insufficient();
    }

    EmaTrend trend;
    trend.ema9 = indicators::ema(prices, 9).value.back();
    trend.ema21 = indicators::ema(prices, 21).value.back();
    trend.ema50 = indicators::ema(prices, 50).value.back();

    const double price = prices.back();
    const double e9 = trend.ema9;
    const double e21 = trend.ema21;
    const double e50 = trend.ema50;

    if (price > e9 && e9 > e21 && e21 > e50) {
        double separation = (e9 - e50) / e50 * 100;
        trend.type = EmaTrendType::STRONG_UP;
        trend.strength = std::min(separation * 10, 100.0);
    } else if (price < e9 && e9 < e21 && e21 < e50) {
        double separation = (e50 - e9) / e50 * 100;
        trend.type = EmaTrendType::STRONG_DOWN;
        trend.strength = std::min(separation * 10, 100.0);
    } else if (price > e21 && e9 > e21) {
        trend.type = EmaTrendType::UP;
        trend.strength = 50;
    } else if (price < e21 && e9 < e21) {
        trend.type = EmaTrendType::DOWN;
        trend.strength = 50;
    } else {
        trend.type = EmaTrendType::SIDEWAYS;
        trend.strength = 20;
    }

    return IndicatorResult<EmaTrend>::sufficient(trend);
}

}  // namespace patterns
}  // namespace signal_ngin
