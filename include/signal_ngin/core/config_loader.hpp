// include/signal_ngin/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/data/caching_candle_provider.hpp"
#include "signal_ngin/signal/batch_processor.hpp"
#include "signal_ngin/signal/signal_classifier.hpp"

namespace signal_ngin {

/**
 * @brief Consolidated application configuration
 *
 * Sections: "logging", "classifier", "batch", "cache", "macro" plus the scan
 * settings at the top level. Missing sections and keys keep their defaults.
 */
struct AppConfig {
    LoggerConfig logging;
    ClassifierConfig classifier;
    BatchFilterConfig batch;
    data::CacheConfig cache;

    std::string data_directory{"data"};  // Where the file provider looks for candles
    std::vector<std::string> fallback_directories;  // Tried in order when data_directory fails
    std::string interval{"1h"};
    size_t candle_limit{168};  // 7 days of hourly candles
    std::vector<std::string> assets;
    MacroContext macro;
    std::map<std::string, double> change_24h;  // Percent, per asset; 0 when absent

    /**
     * @brief One request per configured asset, carrying the macro context and the
     *        asset's 24h change
     */
    std::vector<AssetRequest> asset_requests() const;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["logging"] = logging.to_json();
        j["classifier"] = classifier.to_json();
        j["batch"] = batch.to_json();
        j["cache"] = cache.to_json();
        j["data_directory"] = data_directory;
        j["fallback_directories"] = fallback_directories;
        j["interval"] = interval;
        j["candle_limit"] = candle_limit;
        j["assets"] = assets;
        j["macro"] = {{"fear_greed", macro.fear_greed}, {"fear_label", macro.fear_label}};
        j["change_24h"] = change_24h;
        return j;
    }
};

/**
 * @brief Loads AppConfig from JSON files
 *
 * Either a single file, or a defaults file with an override file merged on top
 * (nested objects are merged key by key, other values are replaced).
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from one file
     * @param config_path Path to the JSON file
     * @return AppConfig, or FILE_NOT_FOUND, JSON_PARSE_ERROR or CONFIG_ERROR
     */
    static Result<AppConfig> load(const std::filesystem::path& config_path);

    /**
     * @brief Load defaults and merge an override file on top
     * @param defaults_path Shared defaults
     * @param override_path Deployment specific values
     * @return AppConfig, or FILE_NOT_FOUND, JSON_PARSE_ERROR or CONFIG_ERROR
     */
    static Result<AppConfig> load(const std::filesystem::path& defaults_path,
                                  const std::filesystem::path& override_path);

    /**
     * @brief Build and validate AppConfig from an already parsed document
     */
    static Result<AppConfig> from_json(const nlohmann::json& j);

    /**
     * @brief Recursively merge JSON objects
     * @param target Target JSON object (modified in place)
     * @param source Source JSON object to merge from
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

    /**
     * @brief Validate the values of a configuration
     * @return CONFIG_ERROR describing the first invalid value
     */
    static Result<void> validate(const AppConfig& config);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);
    static void log_config_summary(const AppConfig& config);
};

}  // namespace signal_ngin
