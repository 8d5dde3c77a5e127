// src/indicators/volatility.cpp

#include "signal_ngin/indicators/volatility.hpp"
#include <algorithm>
#include <cmath>

namespace signal_ngin {
namespace indicators {

namespace {

struct WindowStats {
    double mean{0.0};
    double std_dev{0.0};
};

WindowStats window_stats(const double* first, int period) {
    WindowStats stats;
    for (int i = 0; i < period; ++i) {
        stats.mean += first[i];
    }
    stats.mean /= period;

    double variance = 0.0;
    for (int i = 0; i < period; ++i) {
        variance += std::pow(first[i] - stats.mean, 2);
    }
    stats.std_dev = std::sqrt(variance / period);
    return stats;
}

}  // namespace

double bandwidth_of_window(const double* first, int period, double std_dev) {
    WindowStats stats = window_stats(first, period);
    if (stats.mean == 0.0) {
        return 0.0;
    }
    double upper = stats.mean + std_dev * stats.std_dev;
    double lower = stats.mean - std_dev * stats.std_dev;
    return (upper - lower) / stats.mean * 100.0;
}

IndicatorResult<BollingerBands> bollinger_bands(const Series& prices, int period,
                                                double std_dev) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        BollingerBands collapsed;
        double price = prices.empty() ? 0.0 : prices.back();
        collapsed.upper = price;
        collapsed.middle = price;
        collapsed.lower = price;
        return IndicatorResult<BollingerBands>::insufficient(collapsed);
    }

    WindowStats stats = window_stats(prices.data() + prices.size() - period, period);

    BollingerBands bands;
    bands.middle = stats.mean;
    bands.upper = stats.mean + std_dev * stats.std_dev;
    bands.lower = stats.mean - std_dev * stats.std_dev;

    const double width = bands.upper - bands.lower;
    bands.bandwidth = stats.mean != 0.0 ? width / stats.mean * 100.0 : 0.0;
    bands.percent_b = width > 0 ? (prices.back() - bands.lower) / width : 0.5;

    return IndicatorResult<BollingerBands>::sufficient(bands);
}

double true_range(const Candle& current, const Candle& previous) {
    return std::max({current.high - current.low, std::abs(current.high - previous.close),
                     std::abs(current.low - previous.close)});
}

IndicatorResult<double> atr(const CandleSeries& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period) + 1) {
        return IndicatorResult<double>::insufficient(0.0);
    }

    double sum = 0.0;
    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        sum += true_range(candles[i], candles[i - 1]);
    }
    return IndicatorResult<double>::sufficient(sum / period);
}

}  // namespace indicators
}  // namespace signal_ngin
