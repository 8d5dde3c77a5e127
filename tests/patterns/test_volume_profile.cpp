#include <gtest/gtest.h>
#include "../signal/candle_fixtures.hpp"
#include "signal_ngin/patterns/volume_profile.hpp"

using namespace signal_ngin;
using namespace signal_ngin::patterns;
using signal_ngin::testing::candles_from_prices;

class VolumeProfileTest : public ::testing::Test {
protected:
    static std::vector<double> linear(size_t count, double start, double step) {
        std::vector<double> prices;
        for (size_t i = 0; i < count; ++i) {
            prices.push_back(start + step * static_cast<double>(i));
        }
        return prices;
    }

    static std::function<double(size_t)> step_volume(size_t at, double before, double after) {
        return [=](size_t i) { return i < at ? before : after; };
    }
};

TEST_F(VolumeProfileTest, RisingOnHeavierVolumeConfirmsUp) {
    CandleSeries candles;
    for (int i = 0; i < 28; ++i) {
        const double close = 100.0 + i;
        candles.emplace_back(Timestamp(std::chrono::hours(i)), close - 0.5, close + 0.5,
                             close - 1.0, close, i < 14 ? 1000.0 : 2000.0);
    }

    auto result = analyze_volume_profile(candles);
    ASSERT_TRUE(result.is_sufficient());
    EXPECT_EQ(result.value.type, VolumeProfileType::CONFIRMING_UP);
    EXPECT_DOUBLE_EQ(result.value.ratio, 2.0);
    EXPECT_EQ(result.value.buy_pressure, 100);
    EXPECT_EQ(to_string(result.value.type), "confirming_up");
}

TEST_F(VolumeProfileTest, FallingOnHeavierVolumeConfirmsDown) {
    auto candles = candles_from_prices(linear(28, 200.0, -1.0), step_volume(14, 1000.0, 2000.0));
    auto result = analyze_volume_profile(candles);
    EXPECT_EQ(result.value.type, VolumeProfileType::CONFIRMING_DOWN);
    EXPECT_DOUBLE_EQ(result.value.ratio, 2.0);
    EXPECT_EQ(result.value.buy_pressure, 0);
}

TEST_F(VolumeProfileTest, FallingOnFadingVolumeIsNeutral) {
    auto candles = candles_from_prices(linear(28, 200.0, -1.0), step_volume(14, 2000.0, 500.0));
    auto result = analyze_volume_profile(candles);
    EXPECT_EQ(result.value.type, VolumeProfileType::NEUTRAL);
    EXPECT_DOUBLE_EQ(result.value.ratio, 0.25);
    EXPECT_EQ(result.value.buy_pressure, 0);
}

// Price climbs in a zigzag while most of the recent volume trades on the down legs
TEST_F(VolumeProfileTest, RisingOnSellingVolumeIsDiverging) {
    std::vector<double> closes{100.0};
    for (size_t i = 1; i < 28; ++i) {
        closes.push_back(closes.back() + (i % 2 == 1 ? 3.0 : -1.0));
    }
    auto candles = candles_from_prices(closes, [](size_t i) {
        if (i < 14) {
            return 1000.0;
        }
        return i % 2 == 0 ? 3000.0 : 1000.0;
    });

    auto result = analyze_volume_profile(candles);
    EXPECT_EQ(result.value.type, VolumeProfileType::DIVERGING);
    EXPECT_DOUBLE_EQ(result.value.ratio, 2.0);
    EXPECT_EQ(result.value.buy_pressure, 25);
}

TEST_F(VolumeProfileTest, ShortHistoryUsesPartialOlderWindow) {
    auto candles = candles_from_prices(linear(20, 100.0, 1.0), step_volume(6, 1000.0, 1500.0));
    auto result = analyze_volume_profile(candles);
    ASSERT_TRUE(result.is_sufficient());
    EXPECT_EQ(result.value.type, VolumeProfileType::CONFIRMING_UP);
    EXPECT_DOUBLE_EQ(result.value.ratio, 1.5);
}

TEST_F(VolumeProfileTest, InsufficientCandles) {
    auto result = analyze_volume_profile(candles_from_prices(linear(14, 100.0, 1.0)));
    EXPECT_FALSE(result.is_sufficient());
    EXPECT_EQ(result.value.type, VolumeProfileType::NEUTRAL);
    EXPECT_DOUBLE_EQ(result.value.ratio, 1.0);
    EXPECT_EQ(result.value.buy_pressure, 50);
}
