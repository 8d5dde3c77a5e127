// src/signal/batch_processor.cpp

#include "signal_ngin/signal/batch_processor.hpp"
#include <algorithm>
#include <future>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

namespace {

nlohmann::json threshold_to_json(const CriticalThreshold& threshold) {
    return {{"min_confidence", threshold.min_confidence},
            {"score_bound", threshold.score_bound}};
}

void threshold_from_json(const nlohmann::json& j, CriticalThreshold& threshold) {
    if (j.contains("min_confidence"))
        threshold.min_confidence = j.at("min_confidence").get<int>();
    if (j.contains("score_bound"))
        threshold.score_bound = j.at("score_bound").get<int>();
}

}  // namespace

nlohmann::json BatchFilterConfig::to_json() const {
    nlohmann::json j;
    j["min_confidence"] = min_confidence;
    j["hold_min_confidence"] = hold_min_confidence;
    j["critical_buy"] = threshold_to_json(critical_buy);
    j["critical_sell"] = threshold_to_json(critical_sell);
    return j;
}

void BatchFilterConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_confidence"))
        min_confidence = j.at("min_confidence").get<int>();
    if (j.contains("hold_min_confidence"))
        hold_min_confidence = j.at("hold_min_confidence").get<int>();
    if (j.contains("critical_buy"))
        threshold_from_json(j.at("critical_buy"), critical_buy);
    if (j.contains("critical_sell"))
        threshold_from_json(j.at("critical_sell"), critical_sell);
}

BatchProcessor::BatchProcessor(std::shared_ptr<const SignalClassifier> classifier,
                               BatchFilterConfig config)
    : classifier_(std::move(classifier)), config_(std::move(config)) {
    if (!classifier_) {
        throw SignalError(ErrorCode::INVALID_ARGUMENT, "Classifier is required", "BatchProcessor");
    }
}

std::vector<Signal> BatchProcessor::filter_signals(const std::vector<Signal>& signals) const {
    std::vector<Signal> kept;
    for (const auto& signal : signals) {
        const int floor = signal.action() == SignalAction::HOLD ? config_.hold_min_confidence
                                                                : config_.min_confidence;
        if (signal.confidence() >= floor) {
            kept.push_back(signal);
        }
    }
    return kept;
}

void BatchProcessor::sort_by_confidence(std::vector<Signal>& signals) {
    std::stable_sort(signals.begin(), signals.end(), [](const Signal& a, const Signal& b) {
        return a.confidence() > b.confidence();
    });
}

std::vector<Signal> BatchProcessor::filter_critical(const std::vector<Signal>& signals) const {
    std::vector<Signal> critical;
    for (const auto& signal : signals) {
        bool keep = false;
        if (signal.action() == SignalAction::BUY) {
            keep = signal.confidence() >= config_.critical_buy.min_confidence &&
                   signal.raw_score() >= config_.critical_buy.score_bound;
        } else if (signal.action() == SignalAction::SELL) {
            keep = signal.confidence() >= config_.critical_sell.min_confidence &&
                   signal.raw_score() <= config_.critical_sell.score_bound;
        }
        if (keep) {
            critical.push_back(signal);
        }
    }
    return critical;
}

BatchResult BatchProcessor::process(const std::vector<AssetInput>& inputs) const {
    std::vector<Signal> all;
    all.reserve(inputs.size());
    for (const auto& input : inputs) {
        all.push_back(classifier_->classify(input.asset, input.candles, input.context));
    }
    return finish(std::move(all));
}

BatchResult BatchProcessor::process_from_provider(data::CandleProvider& provider,
                                                  const std::vector<AssetRequest>& requests) const {
    std::vector<std::future<Signal>> tasks;
    tasks.reserve(requests.size());

    for (const auto& request : requests) {
        tasks.push_back(std::async(std::launch::async, [this, &provider, request]() {
            Logger::register_component("BatchProcessor");

            MarketContext context = request.context;
            context.interval = request.interval;

            CandleSeries candles;
            try {
                auto fetched = provider.fetch_candles(request.asset, request.interval,
                                                      request.limit);
                if (fetched.is_ok()) {
                    candles = fetched.value();
                } else {
                    WARN("Fetch failed for " << request.asset << ", degrading to HOLD: "
                                             << fetched.error()->what());
                }
            } catch (const std::exception& e) {
                WARN("Fetch threw for " << request.asset << ", degrading to HOLD: " << e.what());
                candles.clear();
            }
            return classifier_->classify(request.asset, candles, context);
        }));
    }

    std::vector<Signal> all;
    all.reserve(tasks.size());
    for (auto& task : tasks) {
        all.push_back(task.get());
    }
    return finish(std::move(all));
}

BatchResult BatchProcessor::finish(std::vector<Signal> all) const {
    BatchResult result;
    result.signals = filter_signals(all);
    sort_by_confidence(result.signals);
    result.critical = filter_critical(result.signals);
    result.all = std::move(all);

    INFO("Batch classified " << result.all.size() << " assets: " << result.signals.size()
                             << " passed filters, " << result.critical.size() << " critical");
    return result;
}

}  // namespace signal_ngin
