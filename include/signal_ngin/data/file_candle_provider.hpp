// include/signal_ngin/data/file_candle_provider.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/data/candle_provider.hpp"

namespace signal_ngin {
namespace data {

/**
 * @brief Reads candles from JSON files on disk
 *
 * The file for an asset is <directory>/<asset>_<interval>.json and holds an array of
 * {"timestamp": <unix ms>, "open", "high", "low", "close", "volume"} objects.
 */
class FileCandleProvider : public CandleProvider {
public:
    explicit FileCandleProvider(std::filesystem::path directory);

    /**
     * @brief Load the last `limit` candles of the asset's file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR or INVALID_DATA on failure
     */
    Result<CandleSeries> fetch_candles(const std::string& asset, const std::string& interval,
                                       size_t limit) override;

    std::filesystem::path path_for(const std::string& asset, const std::string& interval) const;

    /**
     * @brief Parse a JSON candle array, sorting it by timestamp
     */
    static Result<CandleSeries> parse_candles(const nlohmann::json& j);

    /**
     * @brief Serialize candles in the format read by parse_candles
     */
    static nlohmann::json to_json(const CandleSeries& candles);

private:
    std::filesystem::path directory_;
};

}  // namespace data
}  // namespace signal_ngin
