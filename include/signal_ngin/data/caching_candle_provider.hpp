// include/signal_ngin/data/caching_candle_provider.hpp
#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/core/clock.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/data/candle_cache.hpp"
#include "signal_ngin/data/candle_provider.hpp"

namespace signal_ngin {
namespace data {

/**
 * @brief Cache freshness by candle interval
 */
struct CacheConfig : public ConfigBase {
    int minute_ttl_seconds{60};    // Intervals containing 'm' ("1m", "15m")
    int hourly_ttl_seconds{300};   // "1h"
    int default_ttl_seconds{300};  // Everything else

    std::chrono::seconds ttl_for(const std::string& interval) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Provider decorator adding a TTL cache with stale fallback
 *
 * A fresh entry is served without touching the upstream. Otherwise the upstream
 * is asked; a non-empty answer replaces the entry. When the upstream fails or
 * returns nothing, the stale entry is served if one exists. Concurrent misses on
 * the same key may each reach the upstream.
 */
class CachingCandleProvider : public CandleProvider {
public:
    CachingCandleProvider(std::shared_ptr<CandleProvider> upstream,
                          std::shared_ptr<CandleCache> cache, std::shared_ptr<Clock> clock = nullptr,
                          CacheConfig config = CacheConfig{});

    Result<CandleSeries> fetch_candles(const std::string& asset, const std::string& interval,
                                       size_t limit) override;

private:
    std::shared_ptr<CandleProvider> upstream_;
    std::shared_ptr<CandleCache> cache_;
    std::shared_ptr<Clock> clock_;
    CacheConfig config_;
};

}  // namespace data
}  // namespace signal_ngin
