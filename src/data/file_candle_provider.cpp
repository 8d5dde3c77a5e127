// src/data/file_candle_provider.cpp

#include "signal_ngin/data/file_candle_provider.hpp"
#include <algorithm>
#include <fstream>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/data/fallback_candle_provider.hpp"

namespace signal_ngin {
namespace data {

FileCandleProvider::FileCandleProvider(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileCandleProvider::path_for(const std::string& asset,
                                                   const std::string& interval) const {
    return directory_ / (asset + "_" + interval + ".json");
}

Result<CandleSeries> FileCandleProvider::fetch_candles(const std::string& asset,
                                                       const std::string& interval,
                                                       size_t limit) {
    const auto path = path_for(asset, interval);
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<CandleSeries>(ErrorCode::FILE_NOT_FOUND,
                                        "No candle file for " + asset + " at " + path.string(),
                                        "FileCandleProvider");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<CandleSeries>(ErrorCode::JSON_PARSE_ERROR,
                                        "Failed to parse " + path.string() + ": " + e.what(),
                                        "FileCandleProvider");
    }

    auto parsed = parse_candles(j);
    if (parsed.is_error()) {
        return make_error<CandleSeries>(parsed.error()->code(),
                                        path.string() + ": " + parsed.error()->what(),
                                        "FileCandleProvider");
    }

    CandleSeries candles = parsed.value();
    if (candles.size() > limit) {
        candles.erase(candles.begin(), candles.end() - static_cast<std::ptrdiff_t>(limit));
    }
    DEBUG("Loaded " << candles.size() << " " << interval << " candles for " << asset);
    return candles;
}

Result<CandleSeries> FileCandleProvider::parse_candles(const nlohmann::json& j) {
    if (!j.is_array()) {
        return make_error<CandleSeries>(ErrorCode::INVALID_DATA,
                                        "Candle data must be a JSON array", "FileCandleProvider");
    }

    CandleSeries candles;
    candles.reserve(j.size());
    try {
        // Price-only history, the first row decides for the whole file
        if (!j.empty() && !j.front().contains("open")) {
            std::vector<Timestamp> timestamps;
            std::vector<double> closes;
            std::vector<double> volumes;
            for (const auto& item : j) {
                timestamps.push_back(core::from_unix_millis(item.at("timestamp").get<int64_t>()));
                closes.push_back(item.at("close").get<double>());
                volumes.push_back(item.value("volume", 0.0));
            }
            candles = candles_from_closes(timestamps, closes, volumes);
        } else {
            for (const auto& item : j) {
                candles.emplace_back(core::from_unix_millis(item.at("timestamp").get<int64_t>()),
                                     item.at("open").get<double>(), item.at("high").get<double>(),
                                     item.at("low").get<double>(), item.at("close").get<double>(),
                                     item.value("volume", 0.0));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<CandleSeries>(ErrorCode::INVALID_DATA,
                                        std::string("Malformed candle: ") + e.what(),
                                        "FileCandleProvider");
    }

    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
    return candles;
}

nlohmann::json FileCandleProvider::to_json(const CandleSeries& candles) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& c : candles) {
        j.push_back({{"timestamp", core::to_unix_millis(c.timestamp)},
                     {"open", c.open},
                     {"high", c.high},
                     {"low", c.low},
                     {"close", c.close},
                     {"volume", c.volume}});
    }
    return j;
}

}  // namespace data
}  // namespace signal_ngin
