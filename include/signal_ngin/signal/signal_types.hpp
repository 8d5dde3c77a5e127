// include/signal_ngin/signal/signal_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/indicators/directional_movement.hpp"
#include "signal_ngin/indicators/momentum.hpp"
#include "signal_ngin/indicators/support_resistance.hpp"
#include "signal_ngin/indicators/volatility.hpp"
#include "signal_ngin/patterns/bb_squeeze.hpp"
#include "signal_ngin/patterns/ema_trend.hpp"
#include "signal_ngin/patterns/rsi_divergence.hpp"
#include "signal_ngin/patterns/volume_profile.hpp"

namespace signal_ngin {

enum class SignalAction { BUY, SELL, HOLD };

enum class StrengthLabel { STRONG_BUY, BUY, WEAK_BUY, HOLD, WEAK_SELL, SELL, STRONG_SELL, ERROR };

inline std::string to_string(SignalAction action) {
    switch (action) {
        case SignalAction::BUY:
            return "BUY";
        case SignalAction::SELL:
            return "SELL";
        default:
            return "HOLD";
    }
}

inline std::string to_string(StrengthLabel label) {
    switch (label) {
        case StrengthLabel::STRONG_BUY:
            return "STRONG BUY";
        case StrengthLabel::BUY:
            return "BUY";
        case StrengthLabel::WEAK_BUY:
            return "WEAK BUY";
        case StrengthLabel::WEAK_SELL:
            return "WEAK SELL";
        case StrengthLabel::SELL:
            return "SELL";
        case StrengthLabel::STRONG_SELL:
            return "STRONG SELL";
        case StrengthLabel::ERROR:
            return "ERROR";
        default:
            return "HOLD";
    }
}

/**
 * @brief Market-wide sentiment supplied by the caller
 */
struct MacroContext {
    int fear_greed{50};  // Fear & Greed index, 0 (extreme fear) to 100 (extreme greed)
    std::string fear_label{"Neutral"};
};

/**
 * @brief Exogenous inputs for one classification
 */
struct MarketContext {
    std::optional<double> price;  // Current price, last close when absent
    double change_24h{0.0};       // 24h change in percent
    MacroContext macro;
    std::string interval{"1h"};
};

/**
 * @brief Every indicator computed for one classification
 */
struct IndicatorSnapshot {
    double rsi{50.0};
    indicators::MacdResult macd;
    indicators::BollingerBands bollinger;
    indicators::AdxResult adx;
    patterns::EmaTrend ema_trend;
    patterns::Divergence divergence;
    patterns::VolumeProfile volume_profile;
    patterns::BbSqueeze bb_squeeze;
    indicators::PivotLevels levels;
    double atr{0.0};
    double atr_percent{0.0};  // ATR in percent of the current price

    nlohmann::json to_json() const;
};

/**
 * @brief Field values of a Signal, filled in by the classifier
 */
struct SignalFields {
    std::string asset;
    SignalAction action{SignalAction::HOLD};
    StrengthLabel strength_label{StrengthLabel::HOLD};
    int score{50};      // Display score in [0, 100]
    int raw_score{0};   // Signed score in [-100, 100]
    int confidence{0};  // In [0, 85]
    double price{0.0};
    double change_24h{0.0};
    std::vector<std::string> reasons;
    std::optional<IndicatorSnapshot> indicators;  // Absent on the degraded paths
    Timestamp timestamp;
    std::string interval;
    size_t candles_analyzed{0};
    std::string data_source;  // "ohlcv", "insufficient" or "error"
};

/**
 * @brief Immutable classification result for one asset
 */
class Signal {
public:
    explicit Signal(SignalFields fields) : fields_(std::move(fields)) {}

    const std::string& asset() const {
        return fields_.asset;
    }
    SignalAction action() const {
        return fields_.action;
    }
    StrengthLabel strength_label() const {
        return fields_.strength_label;
    }
    int score() const {
        return fields_.score;
    }
    int raw_score() const {
        return fields_.raw_score;
    }
    int confidence() const {
        return fields_.confidence;
    }
    double price() const {
        return fields_.price;
    }
    double change_24h() const {
        return fields_.change_24h;
    }
    const std::vector<std::string>& reasons() const {
        return fields_.reasons;
    }
    const std::optional<IndicatorSnapshot>& indicators() const {
        return fields_.indicators;
    }
    Timestamp timestamp() const {
        return fields_.timestamp;
    }
    const std::string& interval() const {
        return fields_.interval;
    }
    size_t candles_analyzed() const {
        return fields_.candles_analyzed;
    }
    const std::string& data_source() const {
        return fields_.data_source;
    }

    /**
     * @brief Reasons joined with " • " for display
     */
    std::string reasons_text() const;

    nlohmann::json to_json() const;

private:
    SignalFields fields_;
};

}  // namespace signal_ngin
