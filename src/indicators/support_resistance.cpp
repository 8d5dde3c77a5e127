// src/indicators/support_resistance.cpp

#include "signal_ngin/indicators/support_resistance.hpp"
#include <algorithm>

namespace signal_ngin {
namespace indicators {

namespace {

PivotLevels pivot_levels(double high, double low, double close) {
    PivotLevels levels;
    levels.pivot = (high + low + close) / 3;
    levels.support = (2 * levels.pivot) - high;
    levels.resistance = (2 * levels.pivot) - low;
    return levels;
}

PivotLevels band_around(double price) {
    PivotLevels levels;
    levels.support = price * 0.95;
    levels.resistance = price * 1.05;
    levels.pivot = price;
    return levels;
}

}  // namespace

IndicatorResult<PivotLevels> support_resistance(const CandleSeries& candles, int window) {
    if (candles.size() < 3 || window <= 0) {
        double price = candles.empty() ? 0.0 : candles.back().close;
        return IndicatorResult<PivotLevels>::insufficient(band_around(price));
    }

    size_t first = candles.size() > static_cast<size_t>(window) ? candles.size() - window : 0;
    double high = candles[first].high;
    double low = candles[first].low;
    for (size_t i = first + 1; i < candles.size(); ++i) {
        high = std::max(high, candles[i].high);
        low = std::min(low, candles[i].low);
    }

    return IndicatorResult<PivotLevels>::sufficient(
        pivot_levels(high, low, candles.back().close));
}

IndicatorResult<PivotLevels> support_resistance_from_closes(const Series& prices) {
    if (prices.size() < 3) {
        double price = prices.empty() ? 0.0 : prices.back();
        return IndicatorResult<PivotLevels>::insufficient(band_around(price));
    }

    auto extremes = std::minmax_element(prices.begin(), prices.end());
    return IndicatorResult<PivotLevels>::sufficient(
        pivot_levels(*extremes.second, *extremes.first, prices.back()));
}

}  // namespace indicators
}  // namespace signal_ngin
