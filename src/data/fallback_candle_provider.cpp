// src/data/fallback_candle_provider.cpp

#include "signal_ngin/data/fallback_candle_provider.hpp"
#include <algorithm>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {
namespace data {

FallbackCandleProvider::FallbackCandleProvider(
    std::vector<std::shared_ptr<CandleProvider>> sources)
    : sources_(std::move(sources)) {
    sources_.erase(std::remove(sources_.begin(), sources_.end(), nullptr), sources_.end());
    if (sources_.empty()) {
        throw SignalError(ErrorCode::INVALID_ARGUMENT, "At least one candle source is required",
                          "FallbackCandleProvider");
    }
}

Result<CandleSeries> FallbackCandleProvider::fetch_candles(const std::string& asset,
                                                           const std::string& interval,
                                                           size_t limit) {
    std::unique_ptr<SignalError> last_error;

    for (size_t i = 0; i < sources_.size(); ++i) {
        auto result = sources_[i]->fetch_candles(asset, interval, limit);
        if (result.is_error()) {
            WARN("Candle source " << i << " failed for " << asset << ": "
                                  << result.error()->what());
            last_error = std::make_unique<SignalError>(*result.error());
            continue;
        }
        if (!result.value().empty()) {
            if (i > 0) {
                INFO("Candle source " << i << " served " << asset << " after fallback");
            }
            return result;
        }
    }

    if (last_error) {
        return Result<CandleSeries>(std::move(last_error));
    }
    return CandleSeries{};
}

CandleSeries candles_from_closes(const std::vector<Timestamp>& timestamps,
                                 const std::vector<double>& prices,
                                 const std::vector<double>& volumes) {
    const size_t n = std::min(timestamps.size(), prices.size());
    CandleSeries candles;
    candles.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double price = prices[i];
        const double volume = i < volumes.size() ? volumes[i] : 0.0;
        candles.emplace_back(timestamps[i], price, price * 1.005, price * 0.995, price, volume);
    }
    return candles;
}

}  // namespace data
}  // namespace signal_ngin
