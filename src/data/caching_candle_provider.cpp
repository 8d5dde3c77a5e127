// src/data/caching_candle_provider.cpp

#include "signal_ngin/data/caching_candle_provider.hpp"
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {
namespace data {

std::chrono::seconds CacheConfig::ttl_for(const std::string& interval) const {
    if (interval.find('m') != std::string::npos) {
        return std::chrono::seconds(minute_ttl_seconds);
    }
    if (interval == "1h") {
        return std::chrono::seconds(hourly_ttl_seconds);
    }
    return std::chrono::seconds(default_ttl_seconds);
}

nlohmann::json CacheConfig::to_json() const {
    nlohmann::json j;
    j["minute_ttl_seconds"] = minute_ttl_seconds;
    j["hourly_ttl_seconds"] = hourly_ttl_seconds;
    j["default_ttl_seconds"] = default_ttl_seconds;
    return j;
}

void CacheConfig::from_json(const nlohmann::json& j) {
    if (j.contains("minute_ttl_seconds"))
        minute_ttl_seconds = j.at("minute_ttl_seconds").get<int>();
    if (j.contains("hourly_ttl_seconds"))
        hourly_ttl_seconds = j.at("hourly_ttl_seconds").get<int>();
    if (j.contains("default_ttl_seconds"))
        default_ttl_seconds = j.at("default_ttl_seconds").get<int>();
}

CachingCandleProvider::CachingCandleProvider(std::shared_ptr<CandleProvider> upstream,
                                             std::shared_ptr<CandleCache> cache,
                                             std::shared_ptr<Clock> clock, CacheConfig config)
    : upstream_(std::move(upstream)),
      cache_(std::move(cache)),
      clock_(clock ? std::move(clock) : SystemClock::shared()),
      config_(std::move(config)) {
    if (!upstream_ || !cache_) {
        throw SignalError(ErrorCode::INVALID_ARGUMENT, "Upstream provider and cache are required",
                          "CachingCandleProvider");
    }
}

Result<CandleSeries> CachingCandleProvider::fetch_candles(const std::string& asset,
                                                          const std::string& interval,
                                                          size_t limit) {
    const CacheKey key{asset, interval, limit};
    std::optional<CacheEntry> cached = cache_->get(key);

    if (cached && clock_->now() - cached->stored_at < config_.ttl_for(interval)) {
        TRACE("Cache hit for " << asset << " " << interval);
        return std::move(cached->candles);
    }

    auto fetched = upstream_->fetch_candles(asset, interval, limit);
    if (fetched.is_ok() && !fetched.value().empty()) {
        cache_->set(key, fetched.value());
        return fetched;
    }

    if (cached) {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(clock_->now() -
                                                                    cached->stored_at);
        WARN("Using stale candle cache for " << asset << " " << interval << " (age "
                                             << age.count() << "s): "
                                             << (fetched.is_error() ? fetched.error()->what()
                                                                    : "upstream returned no candles"));
        return std::move(cached->candles);
    }

    return fetched;
}

}  // namespace data
}  // namespace signal_ngin
