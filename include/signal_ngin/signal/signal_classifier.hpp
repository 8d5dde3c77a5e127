// include/signal_ngin/signal/signal_classifier.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/core/clock.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/signal/signal_types.hpp"

namespace signal_ngin {

/**
 * @brief Indicator periods and windows used by the classifier
 *
 * Scoring weights and thresholds are fixed and deliberately not part of the
 * configuration.
 */
struct ClassifierConfig : public ConfigBase {
    int rsi_period{14};
    int macd_fast{12};
    int macd_slow{26};
    int macd_signal{9};
    int bollinger_period{20};
    double bollinger_std_dev{2.0};
    int adx_period{14};
    int atr_period{14};
    int volume_lookback{14};
    int divergence_lookback{20};
    int squeeze_period{20};
    int support_resistance_window{30};
    size_t min_candles{50};  // Below this the classifier returns the insufficient-data HOLD

    /**
     * @brief Check that every period is usable
     * @return INVALID_ARGUMENT naming the first offending field
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Multi-factor BUY/SELL/HOLD classifier
 *
 * Scores start at 0 (no directional bias) and confidence at 0 (it has to be earned
 * by corroborating factors). Ten ordered factors adjust both, an agreement check
 * rewards alignment and penalizes conflict, and the action is resolved on the
 * signed raw score.
 *
 * The classifier holds no mutable state and may be shared between threads.
 */
class SignalClassifier {
public:
    /**
     * @brief Constructor
     * @param config Indicator configuration
     * @param clock Source of signal timestamps, the system clock when null
     * @throws SignalError if the configuration does not validate
     */
    explicit SignalClassifier(ClassifierConfig config = ClassifierConfig{},
                              std::shared_ptr<Clock> clock = nullptr);

    /**
     * @brief Classify one asset
     *
     * Never throws. Short history yields a HOLD with confidence 15; a failure inside
     * the indicator pipeline yields a HOLD labelled ERROR with confidence 0.
     *
     * @param asset Asset identifier, reported upper-cased
     * @param candles Candle history, oldest first
     * @param context Price, 24h change, macro sentiment and interval
     * @return Signal for the asset
     */
    Signal classify(const std::string& asset, const CandleSeries& candles,
                    const MarketContext& context = MarketContext{}) const;

    /**
     * @brief Compute every indicator the classifier scores
     * @param candles Candle history, oldest first
     * @param price Current price used for the ATR percentage
     */
    IndicatorSnapshot compute_indicators(const CandleSeries& candles, double price) const;

    const ClassifierConfig& config() const {
        return config_;
    }

private:
    Signal score_snapshot(const std::string& asset, const CandleSeries& candles,
                          const MarketContext& context, double price,
                          IndicatorSnapshot snapshot) const;
    Signal insufficient_data(const std::string& asset, const CandleSeries& candles,
                             const MarketContext& context, double price) const;
    Signal analysis_error(const std::string& asset, const CandleSeries& candles,
                          const MarketContext& context, double price) const;

    ClassifierConfig config_;
    std::shared_ptr<Clock> clock_;
};

}  // namespace signal_ngin
