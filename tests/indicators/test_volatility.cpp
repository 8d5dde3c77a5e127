#include <gtest/gtest.h>
#include <vector>
#include "../signal/candle_fixtures.hpp"
#include "signal_ngin/indicators/volatility.hpp"

using namespace signal_ngin;
using namespace signal_ngin::indicators;
using signal_ngin::testing::candles_from_prices;
using signal_ngin::testing::flat_candles;
using signal_ngin::testing::flat_prices;
using signal_ngin::testing::price_phases;

// ============================================================================
// Bollinger Bands
// ============================================================================

class BollingerTest : public ::testing::Test {};

TEST_F(BollingerTest, PopulationStandardDeviationBands) {
    Series prices;
    for (int i = 1; i <= 20; ++i) {
        prices.push_back(i);
    }

    auto result = bollinger_bands(prices, 20, 2.0);
    ASSERT_TRUE(result.is_sufficient());
    const BollingerBands& bands = result.value;

    EXPECT_NEAR(bands.middle, 10.5, 1e-12);
    EXPECT_NEAR(bands.upper, 22.032562594670797, 1e-9);
    EXPECT_NEAR(bands.lower, -1.0325625946707966, 1e-9);
    EXPECT_NEAR(bands.bandwidth, 219.6678589461104, 1e-9);
    EXPECT_NEAR(bands.percent_b, 0.9118772355239569, 1e-9);
}

TEST_F(BollingerTest, BandsAreOrdered) {
    Series zigzag = price_phases({{15, 0.02}, {10, -0.03}, {10, 0.01}});
    auto bands = bollinger_bands(zigzag).value;
    ASSERT_GT(bands.bandwidth, 0.0);
    EXPECT_GE(bands.upper, bands.middle);
    EXPECT_GE(bands.middle, bands.lower);
}

TEST_F(BollingerTest, FlatSeriesCollapses) {
    auto result = bollinger_bands(flat_prices(30, 100.0));
    ASSERT_TRUE(result.is_sufficient());
    EXPECT_DOUBLE_EQ(result.value.bandwidth, 0.0);
    EXPECT_DOUBLE_EQ(result.value.percent_b, 0.5);
    EXPECT_DOUBLE_EQ(result.value.upper, 100.0);
    EXPECT_DOUBLE_EQ(result.value.lower, 100.0);
}

TEST_F(BollingerTest, InsufficientDataCollapsesOnLastPrice) {
    auto result = bollinger_bands({10.0, 11.0, 12.5}, 20);
    EXPECT_FALSE(result.is_sufficient());
    EXPECT_DOUBLE_EQ(result.value.upper, 12.5);
    EXPECT_DOUBLE_EQ(result.value.middle, 12.5);
    EXPECT_DOUBLE_EQ(result.value.lower, 12.5);
    EXPECT_DOUBLE_EQ(result.value.bandwidth, 0.0);
    EXPECT_DOUBLE_EQ(result.value.percent_b, 0.5);

    auto empty = bollinger_bands({}, 20);
    EXPECT_DOUBLE_EQ(empty.value.middle, 0.0);
}

TEST_F(BollingerTest, WindowBandwidthMatchesBands) {
    Series prices = price_phases({{30, 0.015}});
    const double direct = bandwidth_of_window(prices.data() + prices.size() - 20, 20);
    EXPECT_NEAR(direct, bollinger_bands(prices).value.bandwidth, 1e-9);

    Series zeros(20, 0.0);
    EXPECT_DOUBLE_EQ(bandwidth_of_window(zeros.data(), 20), 0.0);
}

// ============================================================================
// ATR
// ============================================================================

class AtrTest : public ::testing::Test {};

TEST_F(AtrTest, TrueRangeUsesPreviousClose) {
    Candle previous(Timestamp{}, 10.0, 11.0, 9.0, 10.0, 0.0);
    Candle gap_up(Timestamp{}, 13.0, 14.0, 12.5, 13.5, 0.0);
    Candle inside(Timestamp{}, 10.0, 10.5, 9.5, 10.2, 0.0);

    EXPECT_DOUBLE_EQ(true_range(gap_up, previous), 4.0);
    EXPECT_DOUBLE_EQ(true_range(inside, previous), 1.0);
}

TEST_F(AtrTest, AveragesLastPeriodTrueRanges) {
    auto result = atr(candles_from_prices(price_phases({{40, 0.01}})), 14);
    ASSERT_TRUE(result.is_sufficient());
    EXPECT_NEAR(result.value, 1.9196435707665043, 1e-9);
}

TEST_F(AtrTest, FlatCandlesHaveZeroRange) {
    auto result = atr(flat_candles(20, 100.0));
    ASSERT_TRUE(result.is_sufficient());
    EXPECT_DOUBLE_EQ(result.value, 0.0);
}

TEST_F(AtrTest, InsufficientData) {
    auto result = atr(flat_candles(14, 100.0), 14);
    EXPECT_FALSE(result.is_sufficient());
    EXPECT_DOUBLE_EQ(result.value, 0.0);
}
