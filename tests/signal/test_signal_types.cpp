#include <gtest/gtest.h>
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/signal/signal_types.hpp"

using namespace signal_ngin;

class SignalTypesTest : public ::testing::Test {
protected:
    SignalFields sample_fields() const {
        SignalFields fields;
        fields.asset = "BTC";
        fields.action = SignalAction::BUY;
        fields.strength_label = StrengthLabel::STRONG_BUY;
        fields.score = 78;
        fields.raw_score = 56;
        fields.confidence = 64;
        fields.price = 67250.5;
        fields.change_24h = 3.2;
        fields.reasons = {"Strong uptrend (EMA 9>21>50)", "RSI oversold (28.4)"};
        fields.timestamp = core::from_unix_millis(1709647629000);
        fields.interval = "1h";
        fields.candles_analyzed = 168;
        fields.data_source = "ohlcv";
        return fields;
    }
};

TEST_F(SignalTypesTest, LabelsRenderForDisplay) {
    EXPECT_EQ(to_string(SignalAction::BUY), "BUY");
    EXPECT_EQ(to_string(SignalAction::SELL), "SELL");
    EXPECT_EQ(to_string(SignalAction::HOLD), "HOLD");
    EXPECT_EQ(to_string(StrengthLabel::STRONG_BUY), "STRONG BUY");
    EXPECT_EQ(to_string(StrengthLabel::WEAK_BUY), "WEAK BUY");
    EXPECT_EQ(to_string(StrengthLabel::WEAK_SELL), "WEAK SELL");
    EXPECT_EQ(to_string(StrengthLabel::STRONG_SELL), "STRONG SELL");
    EXPECT_EQ(to_string(StrengthLabel::ERROR), "ERROR");
}

TEST_F(SignalTypesTest, ReasonsJoinWithBullet) {
    Signal signal(sample_fields());
    EXPECT_EQ(signal.reasons_text(),
              "Strong uptrend (EMA 9>21>50) \xE2\x80\xA2 RSI oversold (28.4)");

    SignalFields single = sample_fields();
    single.reasons = {"Insufficient data for reliable analysis"};
    EXPECT_EQ(Signal(single).reasons_text(), "Insufficient data for reliable analysis");

    single.reasons.clear();
    EXPECT_EQ(Signal(single).reasons_text(), "");
}

TEST_F(SignalTypesTest, JsonWithoutIndicators) {
    auto j = Signal(sample_fields()).to_json();

    EXPECT_EQ(j["asset"], "BTC");
    EXPECT_EQ(j["action"], "BUY");
    EXPECT_EQ(j["strength_label"], "STRONG BUY");
    EXPECT_EQ(j["score"], 78);
    EXPECT_EQ(j["raw_score"], 56);
    EXPECT_EQ(j["confidence"], 64);
    EXPECT_DOUBLE_EQ(j["price"].get<double>(), 67250.5);
    EXPECT_EQ(j["timestamp"], "2024-03-05T14:07:09Z");
    EXPECT_EQ(j["interval"], "1h");
    EXPECT_EQ(j["candles_analyzed"], 168);
    EXPECT_EQ(j["data_source"], "ohlcv");
    EXPECT_FALSE(j.contains("indicators"));
}

TEST_F(SignalTypesTest, JsonCarriesIndicatorSnapshot) {
    SignalFields fields = sample_fields();
    IndicatorSnapshot snapshot;
    snapshot.rsi = 28.44;
    snapshot.bollinger.percent_b = 1.2;
    snapshot.atr = 850.0;
    snapshot.atr_percent = 1.26394;
    snapshot.ema_trend.type = patterns::EmaTrendType::STRONG_UP;
    snapshot.bb_squeeze.squeeze = true;
    snapshot.bb_squeeze.direction = patterns::BreakoutDirection::UP;
    fields.indicators = snapshot;

    auto j = Signal(fields).to_json();
    ASSERT_TRUE(j.contains("indicators"));
    const auto& indicators = j["indicators"];
    EXPECT_DOUBLE_EQ(indicators["rsi"].get<double>(), 28.4);
    EXPECT_DOUBLE_EQ(indicators["bollinger"]["percent_b"].get<double>(), 120.0);
    EXPECT_EQ(indicators["bollinger"]["position"], "above");
    EXPECT_EQ(indicators["ema_trend"]["trend"], "strong_up");
    EXPECT_EQ(indicators["bb_squeeze"]["squeeze"], true);
    EXPECT_EQ(indicators["bb_squeeze"]["direction"], "up");
    EXPECT_DOUBLE_EQ(indicators["atr_percent"].get<double>(), 1.26);
    EXPECT_EQ(indicators["divergence"]["type"], "none");
    EXPECT_EQ(indicators["volume_profile"]["profile"], "neutral");
}
