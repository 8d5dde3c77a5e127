// src/data/candle_cache.cpp

#include "signal_ngin/data/candle_cache.hpp"

namespace signal_ngin {
namespace data {

InMemoryCandleCache::InMemoryCandleCache(std::shared_ptr<Clock> clock)
    : clock_(clock ? std::move(clock) : SystemClock::shared()) {}

std::optional<CacheEntry> InMemoryCandleCache::get(const CacheKey& key) const {
    std::shared_ptr<const CacheEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }
    // Entries are immutable once published, the copy can happen outside the lock
    return *entry;
}

void InMemoryCandleCache::set(const CacheKey& key, CandleSeries candles) {
    auto entry = std::make_shared<const CacheEntry>(CacheEntry{std::move(candles), clock_->now()});
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(entry);
}

void InMemoryCandleCache::expire(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
}

void InMemoryCandleCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t InMemoryCandleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace data
}  // namespace signal_ngin
