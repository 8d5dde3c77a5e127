// src/signal/signal_types.cpp

#include "signal_ngin/signal/signal_types.hpp"
#include "signal_ngin/core/math_utils.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {
const char* REASON_SEPARATOR = " \xE2\x80\xA2 ";  // " • "
}

nlohmann::json IndicatorSnapshot::to_json() const {
    nlohmann::json j;
    j["rsi"] = core::round_to_decimals(rsi, 1);
    j["macd"] = {{"macd", macd.macd},
                 {"signal", macd.signal},
                 {"histogram", macd.histogram},
                 {"trend", indicators::to_string(macd.histogram_trend)}};

    std::string position = "within";
    if (bollinger.percent_b > 1) {
        position = "above";
    } else if (bollinger.percent_b < 0) {
        position = "below";
    }
    j["bollinger"] = {{"upper", bollinger.upper},
                      {"middle", bollinger.middle},
                      {"lower", bollinger.lower},
                      {"bandwidth", bollinger.bandwidth},
                      {"percent_b", core::round_to_decimals(bollinger.percent_b * 100, 1)},
                      {"position", position}};

    j["adx"] = {{"adx", adx.adx},
                {"plus_di", adx.plus_di},
                {"minus_di", adx.minus_di},
                {"trend", indicators::to_string(adx.trend)}};
    j["ema_trend"] = {{"trend", patterns::to_string(ema_trend.type)},
                      {"strength", ema_trend.strength}};
    j["divergence"] = {{"type", patterns::to_string(divergence.type)},
                       {"strength", divergence.strength}};
    j["volume_profile"] = {{"profile", patterns::to_string(volume_profile.type)},
                           {"ratio", volume_profile.ratio},
                           {"buy_pressure", volume_profile.buy_pressure}};
    j["bb_squeeze"] = {{"squeeze", bb_squeeze.squeeze},
                       {"direction", patterns::to_string(bb_squeeze.direction)}};
    j["levels"] = {
        {"support", levels.support}, {"resistance", levels.resistance}, {"pivot", levels.pivot}};
    j["atr"] = atr;
    j["atr_percent"] = core::round_to_decimals(atr_percent, 2);
    return j;
}

std::string Signal::reasons_text() const {
    std::string text;
    for (size_t i = 0; i < fields_.reasons.size(); ++i) {
        if (i > 0) {
            text += REASON_SEPARATOR;
        }
        text += fields_.reasons[i];
    }
    return text;
}

nlohmann::json Signal::to_json() const {
    nlohmann::json j;
    j["asset"] = fields_.asset;
    j["action"] = to_string(fields_.action);
    j["strength_label"] = to_string(fields_.strength_label);
    j["score"] = fields_.score;
    j["raw_score"] = fields_.raw_score;
    j["confidence"] = fields_.confidence;
    j["price"] = fields_.price;
    j["change_24h"] = fields_.change_24h;
    j["reasons"] = reasons_text();
    j["timestamp"] = core::format_timestamp(fields_.timestamp, "%Y-%m-%dT%H:%M:%SZ", false);
    j["interval"] = fields_.interval;
    j["candles_analyzed"] = fields_.candles_analyzed;
    j["data_source"] = fields_.data_source;
    if (fields_.indicators) {
        j["indicators"] = fields_.indicators->to_json();
    }
    return j;
}

}  // namespace signal_ngin
