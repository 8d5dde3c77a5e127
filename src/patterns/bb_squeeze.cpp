// src/patterns/bb_squeeze.cpp

#include "signal_ngin/patterns/bb_squeeze.hpp"
#include <algorithm>
#include <vector>
#include "signal_ngin/indicators/volatility.hpp"

namespace signal_ngin {
namespace patterns {

namespace {
constexpr size_t BANDWIDTH_SAMPLES = 20;
constexpr double SQUEEZE_FACTOR = 0.7;
constexpr size_t DIRECTION_WINDOW = 5;
}  // namespace

IndicatorResult<BbSqueeze> detect_bb_squeeze(const Series& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period) + BANDWIDTH_SAMPLES) {
        return IndicatorResult<BbSqueeze>::insufficient();
    }

    std::vector<double> bandwidths;
    bandwidths.reserve(prices.size() - period + 1);
    for (size_t end = period; end <= prices.size(); ++end) {
        bandwidths.push_back(indicators::bandwidth_of_window(prices.data() + end - period, period));
    }

    const size_t samples = std::min(bandwidths.size(), BANDWIDTH_SAMPLES);
    double sum = 0.0;
    for (size_t i = bandwidths.size() - samples; i < bandwidths.size(); ++i) {
        sum += bandwidths[i];
    }

    BbSqueeze result;
    result.bandwidth = bandwidths.back();
    result.avg_bandwidth = sum / samples;
    result.squeeze = result.bandwidth < result.avg_bandwidth * SQUEEZE_FACTOR;
    result.direction = prices.back() > prices[prices.size() - DIRECTION_WINDOW]
                           ? BreakoutDirection::UP
                           : BreakoutDirection::DOWN;

    return IndicatorResult<BbSqueeze>::sufficient(result);
}

}  // namespace patterns
}  // namespace signal_ngin
