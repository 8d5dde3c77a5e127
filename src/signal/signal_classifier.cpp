// src/signal/signal_classifier.cpp

#include "signal_ngin/signal/signal_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/math_utils.hpp"

namespace signal_ngin {

using indicators::MacdTrend;
using patterns::BreakoutDirection;
using patterns::DivergenceType;
using patterns::VolumeProfileType;

// ============================================================================
// Configuration
// ============================================================================

Result<void> ClassifierConfig::validate() const {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "ClassifierConfig");
    };

    if (rsi_period <= 0)
        return invalid("rsi_period must be positive");
    if (macd_fast <= 0 || macd_slow <= 0 || macd_signal <= 0)
        return invalid("MACD periods must be positive");
    if (macd_fast >= macd_slow)
        return invalid("macd_fast must be shorter than macd_slow");
    if (bollinger_period <= 0)
        return invalid("bollinger_period must be positive");
    if (bollinger_std_dev <= 0.0)
        return invalid("bollinger_std_dev must be positive");
    if (adx_period <= 0 || atr_period <= 0)
        return invalid("ADX and ATR periods must be positive");
    if (volume_lookback <= 0)
        return invalid("volume_lookback must be positive");
    if (divergence_lookback < 5)
        return invalid("divergence_lookback must be at least 5");
    if (squeeze_period <= 0)
        return invalid("squeeze_period must be positive");
    if (support_resistance_window < 3)
        return invalid("support_resistance_window must be at least 3");
    if (min_candles == 0)
        return invalid("min_candles must be positive");
    return Result<void>();
}

nlohmann::json ClassifierConfig::to_json() const {
    nlohmann::json j;
    j["rsi_period"] = rsi_period;
    j["macd_fast"] = macd_fast;
    j["macd_slow"] = macd_slow;
    j["macd_signal"] = macd_signal;
    j["bollinger_period"] = bollinger_period;
    j["bollinger_std_dev"] = bollinger_std_dev;
    j["adx_period"] = adx_period;
    j["atr_period"] = atr_period;
    j["volume_lookback"] = volume_lookback;
    j["divergence_lookback"] = divergence_lookback;
    j["squeeze_period"] = squeeze_period;
    j["support_resistance_window"] = support_resistance_window;
    j["min_candles"] = min_candles;
    return j;
}

void ClassifierConfig::from_json(const nlohmann::json& j) {
    if (j.contains("rsi_period"))
        rsi_period = j.at("rsi_period").get<int>();
    if (j.contains("macd_fast"))
        macd_fast = j.at("macd_fast").get<int>();
    if (j.contains("macd_slow"))
        macd_slow = j.at("macd_slow").get<int>();
    if (j.contains("macd_signal"))
        macd_signal = j.at("macd_signal").get<int>();
    if (j.contains("bollinger_period"))
        bollinger_period = j.at("bollinger_period").get<int>();
    if (j.contains("bollinger_std_dev"))
        bollinger_std_dev = j.at("bollinger_std_dev").get<double>();
    if (j.contains("adx_period"))
        adx_period = j.at("adx_period").get<int>();
    if (j.contains("atr_period"))
        atr_period = j.at("atr_period").get<int>();
    if (j.contains("volume_lookback"))
        volume_lookback = j.at("volume_lookback").get<int>();
    if (j.contains("divergence_lookback"))
        divergence_lookback = j.at("divergence_lookback").get<int>();
    if (j.contains("squeeze_period"))
        squeeze_period = j.at("squeeze_period").get<int>();
    if (j.contains("support_resistance_window"))
        support_resistance_window = j.at("support_resistance_window").get<int>();
    if (j.contains("min_candles"))
        min_candles = j.at("min_candles").get<size_t>();
}

// ============================================================================
// Scoring factors
// ============================================================================

namespace {

struct ScoreCard {
    double score{0.0};
    double confidence{0.0};
    std::vector<std::string> reasons;

    void add(double score_delta, double confidence_delta) {
        score += score_delta;
        confidence += confidence_delta;
    }

    void add(double score_delta, double confidence_delta, std::string reason) {
        add(score_delta, confidence_delta);
        reasons.push_back(std::move(reason));
    }
};

std::string fixed(double value, int decimals) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return buffer;
}

// One-decimal value printed without a trailing ".0"
std::string short_number(double value) {
    std::string text = fixed(value, 1);
    if (text.size() > 2 && text.compare(text.size() - 2, 2, ".0") == 0) {
        text.erase(text.size() - 2);
    }
    return text;
}

std::string upper_case(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

void score_trend(const patterns::EmaTrend& trend, ScoreCard& card) {
    switch (trend.type) {
        case patterns::EmaTrendType::STRONG_UP:
            card.add(20, 15, "Strong uptrend (EMA 9>21>50)");
            break;
        case patterns::EmaTrendType::STRONG_DOWN:
            card.add(-20, 15, "Strong downtrend (EMA 9<21<50)");
            break;
        case patterns::EmaTrendType::UP:
            card.add(10, 8, "Moderate uptrend");
            break;
        case patterns::EmaTrendType::DOWN:
            card.add(-10, 8, "Moderate downtrend");
            break;
        default:
            card.add(0, 3, "No clear trend (sideways)");
            break;
    }
}

// Returns the multiplier applied to the RSI and MACD factors
double adx_gate(const indicators::AdxResult& adx, ScoreCard& card) {
    if (adx.adx >= 30) {
        card.add(0, 10, "ADX strong trend (" + short_number(adx.adx) + ")");
        return 1.2;
    }
    if (adx.adx >= 20) {
        card.add(0, 5);
        return 1.0;
    }
    card.reasons.push_back("ADX weak trend (" + short_number(adx.adx) + ") - caution");
    return 0.6;
}

void score_rsi(double rsi, patterns::EmaTrendType trend, double m, ScoreCard& card) {
    const std::string value = " (" + fixed(rsi, 1) + ")";
    if (rsi < 20) {
        card.add(18 * m, 12, "RSI extremely oversold" + value);
    } else if (rsi < 30) {
        card.add(12 * m, 10, "RSI oversold" + value);
    } else if (rsi < 40) {
        if (patterns::is_uptrend(trend)) {
            card.add(8 * m, 6, "RSI bullish pullback in uptrend" + value);
        } else {
            card.add(3, 3, "RSI leaning bullish" + value);
        }
    } else if (rsi > 80) {
        card.add(-18 * m, 12, "RSI extremely overbought" + value);
    } else if (rsi > 70) {
        card.add(-12 * m, 10, "RSI overbought" + value);
    } else if (rsi > 60) {
        if (patterns::is_downtrend(trend)) {
            card.add(-8 * m, 6, "RSI bearish rally in downtrend" + value);
        } else {
            card.add(-3, 3, "RSI leaning bearish" + value);
        }
    } else {
        card.add(0, 2, "RSI neutral" + value);
    }
}

void score_macd(const indicators::MacdResult& macd, double m, ScoreCard& card) {
    const bool growing = macd.histogram_trend == MacdTrend::GROWING;
    if (macd.histogram > 0 && macd.macd > macd.signal) {
        if (growing) {
            card.add(15 * m, 10, "MACD bullish crossover (accelerating)");
        } else {
            card.add(8 * m, 6, "MACD bullish (decelerating)");
        }
    } else if (macd.histogram < 0 && macd.macd < macd.signal) {
        // A shrinking bearish histogram scores the lighter weight but the full confidence
        double weight = macd.histogram_trend == MacdTrend::SHRINKING ? -8 : -15;
        if (growing) {
            card.add(weight * m, 6, "MACD bearish (weakening)");
        } else {
            card.add(weight * m, 10, "MACD bearish crossover (accelerating)");
        }
    } else if (macd.histogram > 0) {
        card.add(4, 3);
    } else if (macd.histogram < 0) {
        card.add(-4, 3);
    }
}

void score_divergence(const patterns::Divergence& divergence, ScoreCard& card) {
    const double weight = std::min(20.0, 10 + divergence.strength);
    const std::string strength = "(strength: " + fixed(divergence.strength, 1) + ")";
    if (divergence.type == DivergenceType::BULLISH) {
        card.add(weight, 12, "Bullish RSI divergence detected " + strength);
    } else if (divergence.type == DivergenceType::BEARISH) {
        card.add(-weight, 12, "Bearish RSI divergence detected " + strength);
    }
}

void score_bollinger(const indicators::BollingerBands& bands, const patterns::BbSqueeze& squeeze,
                     ScoreCard& card) {
    if (squeeze.squeeze) {
        if (squeeze.direction == BreakoutDirection::UP) {
            card.add(8, 5, "BB squeeze \xE2\x86\x92 breakout likely upward");
        } else {
            card.add(-8, 5, "BB squeeze \xE2\x86\x92 breakout likely downward");
        }
    } else if (bands.percent_b <= 0) {
        card.add(10, 7, "Price below lower Bollinger Band");
    } else if (bands.percent_b >= 1) {
        card.add(-10, 7, "Price above upper Bollinger Band");
    } else if (bands.percent_b < 0.2) {
        card.add(5, 4, "Price near lower Bollinger Band");
    } else if (bands.percent_b > 0.8) {
        card.add(-5, 4, "Price near upper Bollinger Band");
    }
}

// Volume only moves confidence, never the score
void weigh_volume(const patterns::VolumeProfile& volume, ScoreCard& card) {
    if (volume.type == VolumeProfileType::CONFIRMING_UP && card.score > 0) {
        card.add(0, 10,
                 "Volume confirms buying (" + std::to_string(volume.buy_pressure) +
                     "% buy pressure)");
    } else if (volume.type == VolumeProfileType::CONFIRMING_DOWN && card.score < 0) {
        card.add(0, 10,
                 "Volume confirms selling (" + std::to_string(100 - volume.buy_pressure) +
                     "% sell pressure)");
    } else if (volume.type == VolumeProfileType::DIVERGING) {
        card.add(0, -8, "Volume diverges from price - weak signal");
    }

    if (volume.ratio > 2.0) {
        card.add(0, 5, "Unusually high volume");
    } else if (volume.ratio < 0.5) {
        card.add(0, -5, "Low volume - weak conviction");
    }
}

void score_levels(const indicators::PivotLevels& levels, double price, ScoreCard& card) {
    if (price <= 0) {
        return;
    }
    const double to_support = (price - levels.support) / price;
    const double to_resistance = (levels.resistance - price) / price;

    if (to_support < 0.02 && to_support > -0.01) {
        card.add(8, 5, "At support level");
    } else if (to_resistance < 0.02 && to_resistance > -0.01) {
        card.add(-8, 5, "At resistance level");
    }
}

void score_momentum(double change_24h, ScoreCard& card) {
    if (change_24h > 10) {
        card.add(5, 3, "Strong 24h momentum (+" + fixed(change_24h, 1) + "%)");
    } else if (change_24h > 5) {
        card.add(4, 2);
    } else if (change_24h < -10) {
        card.add(-5, 3, "Strong 24h selling (" + fixed(change_24h, 1) + "%)");
    } else if (change_24h < -5) {
        card.add(-4, 2);
    }
}

// Contrarian and intentionally small
void score_sentiment(int fear_greed, ScoreCard& card) {
    if (fear_greed < 10) {
        card.add(3, 3, "Extreme fear index (" + std::to_string(fear_greed) + ") - contrarian");
    } else if (fear_greed < 25) {
        card.add(1, 1);
    } else if (fear_greed > 90) {
        card.add(-3, 3, "Extreme greed index (" + std::to_string(fear_greed) + ") - caution");
    } else if (fear_greed > 75) {
        card.add(-1, 1);
    }
}

void check_agreement(const IndicatorSnapshot& s, ScoreCard& card) {
    const auto& volume = s.volume_profile;
    const int bullish = patterns::is_uptrend(s.ema_trend.type) + (s.rsi < 45) +
                        (s.macd.histogram > 0) + (s.divergence.type == DivergenceType::BULLISH) +
                        (s.bollinger.percent_b < 0.3) +
                        (volume.type == VolumeProfileType::CONFIRMING_UP ||
                         volume.buy_pressure > 55);
    const int bearish = patterns::is_downtrend(s.ema_trend.type) + (s.rsi > 55) +
                        (s.macd.histogram < 0) + (s.divergence.type == DivergenceType::BEARISH) +
                        (s.bollinger.percent_b > 0.7) +
                        (volume.type == VolumeProfileType::CONFIRMING_DOWN ||
                         volume.buy_pressure < 45);

    if (bullish >= 2 && bearish >= 2) {
        card.add(0, -10, "Mixed signals - conflicting indicators");
    } else if (bullish >= 4) {
        card.add(0, 10, "Strong multi-factor bullish alignment");
    } else if (bearish >= 4) {
        card.add(0, 10, "Strong multi-factor bearish alignment");
    }
}

SignalAction resolve_action(int raw_score, double confidence) {
    if (raw_score >= 25 || (raw_score >= 15 && confidence >= 40)) {
        return SignalAction::BUY;
    }
    if (raw_score <= -25 || (raw_score <= -15 && confidence >= 40)) {
        return SignalAction::SELL;
    }
    return SignalAction::HOLD;
}

StrengthLabel strength_of(SignalAction action, int raw_score, int confidence) {
    if (action == SignalAction::BUY) {
        if (raw_score >= 50 && confidence >= 60)
            return StrengthLabel::STRONG_BUY;
        if (raw_score >= 35 && confidence >= 45)
            return StrengthLabel::BUY;
        return StrengthLabel::WEAK_BUY;
    }
    if (action == SignalAction::SELL) {
        if (raw_score <= -50 && confidence >= 60)
            return StrengthLabel::STRONG_SELL;
        if (raw_score <= -35 && confidence >= 45)
            return StrengthLabel::SELL;
        return StrengthLabel::WEAK_SELL;
    }
    return StrengthLabel::HOLD;
}

}  // namespace

// ============================================================================
// Classifier
// ============================================================================

SignalClassifier::SignalClassifier(ClassifierConfig config, std::shared_ptr<Clock> clock)
    : config_(std::move(config)), clock_(clock ? std::move(clock) : SystemClock::shared()) {
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw *valid.error();
    }
}

Signal SignalClassifier::classify(const std::string& asset, const CandleSeries& candles,
                                  const MarketContext& context) const {
    const double price =
        context.price.value_or(candles.empty() ? 0.0 : candles.back().close);

    try {
        if (candles.size() < config_.min_candles) {
            WARN(asset << ": " << candles.size() << " candles, " << config_.min_candles
                       << " required, returning HOLD");
            return insufficient_data(asset, candles, context, price);
        }

        Signal signal =
            score_snapshot(asset, candles, context, price, compute_indicators(candles, price));
        DEBUG(signal.asset() << ": " << to_string(signal.action()) << " raw="
                             << signal.raw_score() << " confidence=" << signal.confidence());
        return signal;
    } catch (const std::exception& e) {
        ERROR("Technical analysis failed for " << asset << ": " << e.what());
        return analysis_error(asset, candles, context, price);
    }
}

IndicatorSnapshot SignalClassifier::compute_indicators(const CandleSeries& candles,
                                                       double price) const {
    const indicators::Series prices = closes_of(candles);
    const indicators::Series rsi_trail = indicators::rsi_series(prices, config_.rsi_period).value;

    IndicatorSnapshot snapshot;
    snapshot.rsi = indicators::rsi(prices, config_.rsi_period).value;
    snapshot.macd =
        indicators::macd(prices, config_.macd_fast, config_.macd_slow, config_.macd_signal).value;
    snapshot.bollinger =
        indicators::bollinger_bands(prices, config_.bollinger_period, config_.bollinger_std_dev)
            .value;
    snapshot.adx = indicators::adx(candles, config_.adx_period).value;
    snapshot.ema_trend = patterns::detect_ema_trend(prices).value;
    snapshot.divergence =
        patterns::detect_rsi_divergence(prices, rsi_trail, config_.divergence_lookback).value;
    snapshot.volume_profile =
        patterns::analyze_volume_profile(candles, config_.volume_lookback).value;
    snapshot.bb_squeeze = patterns::detect_bb_squeeze(prices, config_.squeeze_period).value;
    snapshot.levels =
        indicators::support_resistance(candles, config_.support_resistance_window).value;
    snapshot.atr = indicators::atr(candles, config_.atr_period).value;
    snapshot.atr_percent = price > 0 ? snapshot.atr / price * 100 : 0.0;
    return snapshot;
}

Signal SignalClassifier::score_snapshot(const std::string& asset, const CandleSeries& candles,
                                        const MarketContext& context, double price,
                                        IndicatorSnapshot snapshot) const {
    ScoreCard card;

    score_trend(snapshot.ema_trend, card);
    const double m = adx_gate(snapshot.adx, card);
    score_rsi(snapshot.rsi, snapshot.ema_trend.type, m, card);
    score_macd(snapshot.macd, m, card);
    score_divergence(snapshot.divergence, card);
    score_bollinger(snapshot.bollinger, snapshot.bb_squeeze, card);
    weigh_volume(snapshot.volume_profile, card);
    score_levels(snapshot.levels, price, card);
    score_momentum(context.change_24h, card);
    score_sentiment(context.macro.fear_greed, card);
    check_agreement(snapshot, card);

    SignalFields fields;
    fields.asset = upper_case(asset);
    fields.raw_score =
        static_cast<int>(std::clamp(core::round_half_up(card.score), -100.0, 100.0));
    fields.score = static_cast<int>(
        core::round_half_up(std::clamp((card.score + 100) / 2, 0.0, 100.0)));
    fields.action = resolve_action(fields.raw_score, card.confidence);
    fields.confidence =
        static_cast<int>(std::clamp(core::round_half_up(card.confidence), 0.0, 85.0));
    fields.strength_label = strength_of(fields.action, fields.raw_score, fields.confidence);
    fields.price = price;
    fields.change_24h = context.change_24h;
    fields.reasons = std::move(card.reasons);
    fields.indicators = std::move(snapshot);
    fields.timestamp = clock_->now();
    fields.interval = context.interval;
    fields.candles_analyzed = candles.size();
    fields.data_source = "ohlcv";
    return Signal(std::move(fields));
}

Signal SignalClassifier::insufficient_data(const std::string& asset, const CandleSeries& candles,
                                           const MarketContext& context, double price) const {
    SignalFields fields;
    fields.asset = upper_case(asset);
    fields.action = SignalAction::HOLD;
    fields.strength_label = StrengthLabel::HOLD;
    fields.score = 50;
    fields.raw_score = 0;
    fields.confidence = 15;
    fields.price = price;
    fields.change_24h = context.change_24h;
    fields.reasons = {"Insufficient data for reliable analysis"};
    fields.timestamp = clock_->now();
    fields.interval = context.interval;
    fields.candles_analyzed = candles.size();
    fields.data_source = "insufficient";
    return Signal(std::move(fields));
}

Signal SignalClassifier::analysis_error(const std::string& asset, const CandleSeries& candles,
                                        const MarketContext& context, double price) const {
    SignalFields fields;
    fields.asset = upper_case(asset);
    fields.action = SignalAction::HOLD;
    fields.strength_label = StrengthLabel::ERROR;
    fields.score = 50;
    fields.raw_score = 0;
    fields.confidence = 0;
    fields.price = price;
    fields.change_24h = context.change_24h;
    fields.reasons = {"Error in technical analysis - defaulting to HOLD"};
    // The injected clock may be what failed
    fields.timestamp = std::chrono::system_clock::now();
    fields.interval = context.interval;
    fields.candles_analyzed = candles.size();
    fields.data_source = "error";
    return Signal(std::move(fields));
}

}  // namespace signal_ngin
