// include/signal_ngin/data/candle_cache.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include "signal_ngin/core/clock.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace data {

struct CacheKey {
    std::string asset;
    std::string interval;
    size_t limit{0};

    bool operator<(const CacheKey& other) const {
        return std::tie(asset, interval, limit) <
               std::tie(other.asset, other.interval, other.limit);
    }
};

struct CacheEntry {
    CandleSeries candles;
    Timestamp stored_at;
};

/**
 * @brief Store of candle series keyed by asset, interval and limit
 *
 * Entries are whole series: a reader gets either the previous or the new series,
 * never a mixture of the two. Freshness is decided by the reader.
 */
class CandleCache {
public:
    virtual ~CandleCache() = default;

    virtual std::optional<CacheEntry> get(const CacheKey& key) const = 0;
    virtual void set(const CacheKey& key, CandleSeries candles) = 0;
    virtual void expire(const CacheKey& key) = 0;
    virtual void clear() = 0;
};

/**
 * @brief Mutex-protected in-process cache stamped with an injected clock
 */
class InMemoryCandleCache : public CandleCache {
public:
    explicit InMemoryCandleCache(std::shared_ptr<Clock> clock = nullptr);

    std::optional<CacheEntry> get(const CacheKey& key) const override;
    void set(const CacheKey& key, CandleSeries candles) override;
    void expire(const CacheKey& key) override;
    void clear() override;

    size_t size() const;

private:
    std::shared_ptr<Clock> clock_;
    mutable std::mutex mutex_;
    std::map<CacheKey, std::shared_ptr<const CacheEntry>> entries_;
};

}  // namespace data
}  // namespace signal_ngin
