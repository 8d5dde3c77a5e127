#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "../signal/candle_fixtures.hpp"
#include "signal_ngin/data/candle_cache.hpp"
#include "test_data_utils.hpp"

using namespace signal_ngin;
using namespace signal_ngin::data;
using namespace signal_ngin::testing;

class CandleCacheTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        clock_ = std::make_shared<ManualClock>();
        cache_ = std::make_unique<InMemoryCandleCache>(clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<InMemoryCandleCache> cache_;
};

TEST_F(CandleCacheTest, MissReturnsNothing) {
    EXPECT_FALSE(cache_->get({"BTC", "1h", 168}).has_value());
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(CandleCacheTest, SetStampsEntryWithClock) {
    const Timestamp stored = clock_->now();
    cache_->set({"BTC", "1h", 168}, candles_from_prices(flat_prices(5, 100.0)));
    clock_->advance(std::chrono::seconds(30));

    auto entry = cache_->get({"BTC", "1h", 168});
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->candles.size(), 5u);
    EXPECT_EQ(entry->stored_at, stored);
}

TEST_F(CandleCacheTest, KeyIncludesIntervalAndLimit) {
    cache_->set({"BTC", "1h", 168}, candles_from_prices(flat_prices(5, 100.0)));

    EXPECT_FALSE(cache_->get({"BTC", "4h", 168}).has_value());
    EXPECT_FALSE(cache_->get({"BTC", "1h", 100}).has_value());
    EXPECT_FALSE(cache_->get({"ETH", "1h", 168}).has_value());
}

TEST_F(CandleCacheTest, SetReplacesWholeSeries) {
    cache_->set({"BTC", "1h", 168}, candles_from_prices(flat_prices(5, 100.0)));
    clock_->advance(std::chrono::seconds(10));
    cache_->set({"BTC", "1h", 168}, candles_from_prices(flat_prices(3, 200.0)));

    auto entry = cache_->get({"BTC", "1h", 168});
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->candles.size(), 3u);
    EXPECT_DOUBLE_EQ(entry->candles.back().close, 200.0);
    EXPECT_EQ(entry->stored_at, clock_->now());
    EXPECT_EQ(cache_->size(), 1u);
}

TEST_F(CandleCacheTest, ExpireAndClear) {
    cache_->set({"BTC", "1h", 168}, candles_from_prices(flat_prices(5, 100.0)));
    cache_->set({"ETH", "1h", 168}, candles_from_prices(flat_prices(5, 10.0)));

    cache_->expire({"BTC", "1h", 168});
    EXPECT_FALSE(cache_->get({"BTC", "1h", 168}).has_value());
    EXPECT_TRUE(cache_->get({"ETH", "1h", 168}).has_value());

    cache_->expire({"SOL", "1h", 168});
    EXPECT_EQ(cache_->size(), 1u);

    cache_->clear();
    EXPECT_EQ(cache_->size(), 0u);
}

// Readers racing a writer must see one of the two published series, never a blend
TEST_F(CandleCacheTest, ConcurrentReadersSeeWholeSeries) {
    const CacheKey key{"BTC", "1h", 50};
    cache_->set(key, candles_from_prices(flat_prices(50, 100.0)));

    std::thread writer([&]() {
        for (int i = 0; i < 200; ++i) {
            const double price = i % 2 == 0 ? 200.0 : 100.0;
            cache_->set(key, candles_from_prices(flat_prices(50, price)));
        }
    });

    std::vector<std::thread> readers;
    std::atomic<int> mixed{0};
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto entry = cache_->get(key);
                if (!entry) {
                    continue;
                }
                const double first = entry->candles.front().close;
                for (const auto& candle : entry->candles) {
                    if (candle.close != first) {
                        ++mixed;
                        break;
                    }
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(mixed.load(), 0);
}
