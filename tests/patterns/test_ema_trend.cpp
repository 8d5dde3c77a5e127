#include <gtest/gtest.h>
#include "../signal/candle_fixtures.hpp"
#include "signal_ngin/patterns/ema_trend.hpp"

using namespace signal_ngin;
using namespace signal_ngin::patterns;
using signal_ngin::testing::flat_prices;
using signal_ngin::testing::price_phases;

class EmaTrendTest : public ::testing::Test {};

TEST_F(EmaTrendTest, FullBullishAlignmentIsStrongUp) {
    auto result = detect_ema_trend(price_phases({{60, 0.01}}));
    ASSERT_TRUE(result.is_sufficient());
    EXPECT_EQ(result.value.type, EmaTrendType::STRONG_UP);
    EXPECT_DOUBLE_EQ(result.value.strength, 100.0);
    EXPECT_NEAR(result.value.ema9, 173.01873244579392, 1e-9);
    EXPECT_GT(result.value.ema9, result.value.ema21);
    EXPECT_GT(result.value.ema21, result.value.ema50);
}

TEST_F(EmaTrendTest, StrengthScalesWithSeparation) {
    auto result = detect_ema_trend(price_phases({{20, 0.01}, {20, -0.01}, {20, 0.01}}));
    ASSERT_TRUE(result.is_sufficient());
    EXPECT_EQ(result.value.type, EmaTrendType::STRONG_UP);
    EXPECT_NEAR(result.value.strength, 41.595159321195034, 1e-9);
}

TEST_F(EmaTrendTest, FullBearishAlignmentIsStrongDown) {
    auto result = detect_ema_trend(price_phases({{60, -0.01}}));
    EXPECT_EQ(result.value.type, EmaTrendType::STRONG_DOWN);
    EXPECT_DOUBLE_EQ(result.value.strength, 100.0);
    EXPECT_TRUE(is_downtrend(result.value.type));
    EXPECT_FALSE(is_uptrend(result.value.type));
}

// Price above EMA 21 with EMA 9 above EMA 21, but EMA 50 still on top
TEST_F(EmaTrendTest, RecoveryIsModerateUp) {
    auto result = detect_ema_trend(price_phases({{40, -0.01}, {15, 0.01}}));
    EXPECT_EQ(result.value.type, EmaTrendType::UP);
    EXPECT_DOUBLE_EQ(result.value.strength, 50.0);
    EXPECT_TRUE(is_uptrend(result.value.type));
}

TEST_F(EmaTrendTest, PullbackIsModerateDown) {
    auto result = detect_ema_trend(price_phases({{40, 0.01}, {15, -0.01}}));
    EXPECT_EQ(result.value.type, EmaTrendType::DOWN);
    EXPECT_DOUBLE_EQ(result.value.strength, 50.0);
}

TEST_F(EmaTrendTest, FlatIsSideways) {
    auto result = detect_ema_trend(flat_prices(60, 100.0));
    ASSERT_TRUE(result.is_sufficient());
    EXPECT_EQ(result.value.type, EmaTrendType::SIDEWAYS);
    EXPECT_DOUBLE_EQ(result.value.strength, 20.0);
    EXPECT_EQ(to_string(result.value.type), "sideways");
}

TEST_F(EmaTrendTest, NeedsFiftyPrices) {
    auto result = detect_ema_trend(price_phases({{49, 0.01}}));
    EXPECT_FALSE(result.is_sufficient());
    EXPECT_EQ(result.value.type, EmaTrendType::UNKNOWN);
    EXPECT_DOUBLE_EQ(result.value.strength, 0.0);
    EXPECT_EQ(to_string(result.value.type), "unknown");
}
