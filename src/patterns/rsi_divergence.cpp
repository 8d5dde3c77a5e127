// src/patterns/rsi_divergence.cpp

#include "signal_ngin/patterns/rsi_divergence.hpp"
#include <cmath>
#include <vector>

namespace signal_ngin {
namespace patterns {

namespace {

struct Extremum {
    double price{0.0};
    double rsi{0.0};
};

}  // namespace

IndicatorResult<Divergence> detect_rsi_divergence(const Series& prices, const Series& rsi_series,
                                                  int lookback) {
    if (lookback <= 0 || prices.size() < static_cast<size_t>(lookback) + 14 ||
        rsi_series.size() < static_cast<size_t>(lookback)) {
        return IndicatorResult<Divergence>::insufficient();
    }

    const double* p = prices.data() + prices.size() - lookback;
    const double* r = rsi_series.data() + rsi_series.size() - lookback;

    std::vector<Extremum> lows;
    std::vector<Extremum> highs;
    for (int i = 2; i < lookback - 2; ++i) {
        if (p[i] < p[i - 1] && p[i] < p[i - 2] && p[i] < p[i + 1] && p[i] < p[i + 2]) {
            lows.push_back({p[i], r[i]});
        }
        if (p[i] > p[i - 1] && p[i] > p[i - 2] && p[i] > p[i + 1] && p[i] > p[i + 2]) {
            highs.push_back({p[i], r[i]});
        }
    }

    Divergence divergence;
    if (lows.size() >= 2) {
        const Extremum& prev = lows[lows.size() - 2];
        const Extremum& curr = lows.back();
        if (curr.price < prev.price && curr.rsi > prev.rsi) {
            divergence.type = DivergenceType::BULLISH;
            divergence.strength = std::abs(curr.rsi - prev.rsi);
            return IndicatorResult<Divergence>::sufficient(divergence);
        }
    }

    if (highs.size() >= 2) {
        const Extremum& prev = highs[highs.size() - 2];
        const Extremum& curr = highs.back();
        if (curr.price > prev.price && curr.rsi < prev.rsi) {
            divergence.type = DivergenceType::BEARISH;
            divergence.strength = std::abs(prev.rsi - curr.rsi);
        }
    }

    return IndicatorResult<Divergence>::sufficient(divergence);
}

}  // namespace patterns
}  // namespace signal_ngin
