// include/signal_ngin/signal/batch_processor.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/data/candle_provider.hpp"
#include "signal_ngin/signal/signal_classifier.hpp"

namespace signal_ngin {

/**
 * @brief Confidence and score bounds a signal must meet to be critical
 */
struct CriticalThreshold {
    int min_confidence{60};
    int score_bound{35};  // BUY: raw score >= bound, SELL: raw score <= bound
};

/**
 * @brief Inclusion and critical-signal thresholds
 */
struct BatchFilterConfig : public ConfigBase {
    int min_confidence{30};       // Floor for BUY and SELL signals
    int hold_min_confidence{50};  // Floor for HOLD signals
    CriticalThreshold critical_buy{60, 35};
    CriticalThreshold critical_sell{60, -35};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Candles and context for one asset of a batch
 */
struct AssetInput {
    std::string asset;
    CandleSeries candles;
    MarketContext context;
};

/**
 * @brief What to fetch for one asset of a batch
 */
struct AssetRequest {
    std::string asset;
    std::string interval{"1h"};
    size_t limit{168};
    MarketContext context;  // context.interval is overwritten with `interval`
};

struct BatchResult {
    std::vector<Signal> all;       // One per input, input order
    std::vector<Signal> signals;   // Passed the confidence floors, by confidence descending
    std::vector<Signal> critical;  // Subset of `signals` meeting the critical thresholds
};

/**
 * @brief Classifies many assets and ranks the results
 */
class BatchProcessor {
public:
    /**
     * @brief Constructor
     * @param classifier Shared classifier, must not be null
     * @param config Filter thresholds
     */
    explicit BatchProcessor(std::shared_ptr<const SignalClassifier> classifier,
                            BatchFilterConfig config = BatchFilterConfig{});

    /**
     * @brief Keep BUY/SELL signals at or above min_confidence and HOLD signals at or
     *        above hold_min_confidence, preserving order
     */
    std::vector<Signal> filter_signals(const std::vector<Signal>& signals) const;

    /**
     * @brief Stable sort by confidence, highest first
     */
    static void sort_by_confidence(std::vector<Signal>& signals);

    /**
     * @brief Keep BUY/SELL signals meeting their action's critical threshold
     */
    std::vector<Signal> filter_critical(const std::vector<Signal>& signals) const;

    /**
     * @brief Classify pre-fetched inputs, then filter, sort and pick critical signals
     */
    BatchResult process(const std::vector<AssetInput>& inputs) const;

    /**
     * @brief Fetch and classify every request concurrently
     *
     * One task per asset. A failed fetch or an exception inside a task degrades that
     * asset to the insufficient-data HOLD without affecting the others.
     *
     * @param provider Candle source shared by the tasks, must be thread-safe
     * @param requests Assets to fetch
     */
    BatchResult process_from_provider(data::CandleProvider& provider,
                                      const std::vector<AssetRequest>& requests) const;

    const BatchFilterConfig& config() const {
        return config_;
    }

private:
    BatchResult finish(std::vector<Signal> all) const;

    std::shared_ptr<const SignalClassifier> classifier_;
    BatchFilterConfig config_;
};

}  // namespace signal_ngin
