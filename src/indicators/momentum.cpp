// src/indicators/momentum.cpp

#include "signal_ngin/indicators/momentum.hpp"

namespace signal_ngin {
namespace indicators {

namespace {

double rsi_from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return 100.0;
    }
    return 100.0 - (100.0 / (1.0 + avg_gain / avg_loss));
}

// Walks the Wilder-smoothed gain/loss averages and reports the RSI after the seed
// window and after every later delta
template <typename Visitor>
void walk_rsi(const Series& prices, int period, Visitor&& visit) {
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) {
            avg_gain += change;
        } else if (change < 0) {
            avg_loss -= change;
        }
    }
    avg_gain /= period;
    avg_loss /= period;
    visit(rsi_from_averages(avg_gain, avg_loss));

    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
        visit(rsi_from_averages(avg_gain, avg_loss));
    }
}

}  // namespace

IndicatorResult<double> rsi(const Series& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period) + 1) {
        return IndicatorResult<double>::insufficient(50.0);
    }

    double last = 50.0;
    walk_rsi(prices, period, [&last](double value) { last = value; });
    return IndicatorResult<double>::sufficient(last);
}

IndicatorResult<Series> rsi_series(const Series& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period) + 1) {
        return IndicatorResult<Series>::insufficient();
    }

    Series out;
    out.reserve(prices.size() - period);
    walk_rsi(prices, period, [&out](double value) { out.push_back(value); });
    return IndicatorResult<Series>::sufficient(std::move(out));
}

IndicatorResult<MacdResult> macd(const Series& prices, int fast_period, int slow_period,
                                 int signal_period) {
    if (fast_period <= 0 || slow_period < fast_period || signal_period <= 0 ||
        prices.size() < static_cast<size_t>(slow_period)) {
        return IndicatorResult<MacdResult>::insufficient();
    }

    const Series fast = ema(prices, fast_period).value;
    const Series slow = ema(prices, slow_period).value;

    const size_t offset = slow_period - fast_period;
    Series macd_line;
    macd_line.reserve(slow.size());
    for (size_t i = 0; i < slow.size(); ++i) {
        macd_line.push_back(fast[i + offset] - slow[i]);
    }

    const Series signal_line = ema(macd_line, signal_period).value;

    MacdResult result;
    const size_t sig_offset = macd_line.size() - signal_line.size();
    result.histogram_series.reserve(signal_line.size());
    for (size_t i = 0; i < signal_line.size(); ++i) {
        result.histogram_series.push_back(macd_line[i + sig_offset] - signal_line[i]);
    }

    result.macd = macd_line.back();
    result.signal = signal_line.empty() ? 0.0 : signal_line.back();
    result.histogram = result.macd - result.signal;

    const auto& hist = result.histogram_series;
    if (hist.size() >= 3) {
        result.histogram_trend = hist[hist.size() - 1] > hist[hist.size() - 3]
                                     ? MacdTrend::GROWING
                                     : MacdTrend::SHRINKING;
    }

    return IndicatorResult<MacdResult>::sufficient(std::move(result));
}

}  // namespace indicators
}  // namespace signal_ngin
