// src/indicators/moving_averages.cpp

#include "signal_ngin/indicators/moving_averages.hpp"

#include <cstddef>

namespace signal_ngin {
namespace indicators {

IndicatorResult<Series> sma(const Series& series, int period) {
    if (period <= 0 || series.size() < static_cast<size_t>(period)) {
        return IndicatorResult<Series>::insufficient();
    }

    Series out;
    out.reserve(series.size() - period + 1);
    for (size_t i = period - 1; i < series.size(); ++i) {
        double sum = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            sum += series[j];
        }
        out.push_back(sum / period);
    }
    return IndicatorResult<Series>::sufficient(std::move(out));
}

IndicatorResult<Series> ema(const Series& series, int period) {
    if (series.size() == 1) {
        return IndicatorResult<Series>::sufficient(series);
    }
    if (period <= 0 || series.size() < static_cast<size_t>(period)) {
        return IndicatorResult<Series>::insufficient();
    }

    const double k = 2.0 / (period + 1);

    double seed = 0.0;
    for (int i = 0; i < period; ++i) {
        seed += series[i];
    }

    Series out;
    out.reserve(series.size() - period + 1);
    out.push_back(seed / period);
    for (size_t i = period; i < series.size(); ++i) {
        out.push_back(series[i] * k + out.back() * (1 - k));
    }
    return IndicatorResult<Series>::sufficient(std::move(out));
}

}  // namespace indicators
}  // namespace signal_ngin
