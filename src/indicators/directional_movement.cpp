// src/indicators/directional_movement.cpp

#include "signal_ngin/indicators/directional_movement.hpp"
#include <cmath>
#include <vector>
#include "signal_ngin/core/math_utils.hpp"
#include "signal_ngin/indicators/volatility.hpp"

namespace signal_ngin {
namespace indicators {

namespace {

struct DirectionalSample {
    double dx{0.0};
    double plus_di{0.0};
    double minus_di{0.0};
};

double wilder(double previous, double value, int period) {
    return (previous * (period - 1) + value) / period;
}

}  // namespace

IndicatorResult<AdxResult> adx(const CandleSeries& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period) + 2) {
        return IndicatorResult<AdxResult>::insufficient();
    }

    const size_t n = candles.size() - 1;
    std::vector<double> true_ranges(n);
    std::vector<double> plus_dm(n);
    std::vector<double> minus_dm(n);

    for (size_t i = 1; i < candles.size(); ++i) {
        const Candle& cur = candles[i];
        const Candle& prev = candles[i - 1];

        true_ranges[i - 1] = true_range(cur, prev);

        double up_move = cur.high - prev.high;
        double down_move = prev.low - cur.low;
        plus_dm[i - 1] = (up_move > down_move && up_move > 0) ? up_move : 0.0;
        minus_dm[i - 1] = (down_move > up_move && down_move > 0) ? down_move : 0.0;
    }

    double atr_value = 0.0;
    double smooth_plus = 0.0;
    double smooth_minus = 0.0;
    for (int i = 0; i < period; ++i) {
        atr_value += true_ranges[i];
        smooth_plus += plus_dm[i];
        smooth_minus += minus_dm[i];
    }
    atr_value /= period;
    smooth_plus /= period;
    smooth_minus /= period;

    std::vector<DirectionalSample> samples;
    samples.reserve(n - period);
    for (size_t i = period; i < n; ++i) {
        atr_value = wilder(atr_value, true_ranges[i], period);
        smooth_plus = wilder(smooth_plus, plus_dm[i], period);
        smooth_minus = wilder(smooth_minus, minus_dm[i], period);

        DirectionalSample sample;
        sample.plus_di = atr_value > 0 ? smooth_plus / atr_value * 100.0 : 0.0;
        sample.minus_di = atr_value > 0 ? smooth_minus / atr_value * 100.0 : 0.0;
        double di_sum = sample.plus_di + sample.minus_di;
        sample.dx = di_sum > 0 ? std::abs(sample.plus_di - sample.minus_di) / di_sum * 100.0 : 0.0;
        samples.push_back(sample);
    }

    if (samples.size() < static_cast<size_t>(period)) {
        return IndicatorResult<AdxResult>::insufficient();
    }

    double adx_value = 0.0;
    for (int i = 0; i < period; ++i) {
        adx_value += samples[i].dx;
    }
    adx_value /= period;
    for (size_t i = period; i < samples.size(); ++i) {
        adx_value = wilder(adx_value, samples[i].dx, period);
    }

    const DirectionalSample& last = samples.back();
    const bool up = last.plus_di > last.minus_di;

    AdxResult result;
    if (adx_value >= 25) {
        result.trend = up ? AdxTrend::STRONG_UP : AdxTrend::STRONG_DOWN;
    } else if (adx_value >= 20) {
        result.trend = up ? AdxTrend::WEAK_UP : AdxTrend::WEAK_DOWN;
    } else {
        result.trend = AdxTrend::RANGING;
    }
    result.adx = core::round_to_decimals(adx_value, 1);
    result.plus_di = core::round_to_decimals(last.plus_di, 1);
    result.minus_di = core::round_to_decimals(last.minus_di, 1);

    return IndicatorResult<AdxResult>::sufficient(result);
}

}  // namespace indicators
}  // namespace signal_ngin
