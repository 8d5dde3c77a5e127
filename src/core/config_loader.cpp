// src/core/config_loader.cpp

#include "signal_ngin/core/config_loader.hpp"

#include <fstream>

namespace signal_ngin {

std::vector<AssetRequest> AppConfig::asset_requests() const {
    std::vector<AssetRequest> requests;
    requests.reserve(assets.size());
    for (const auto& asset : assets) {
        AssetRequest request;
        request.asset = asset;
        request.interval = interval;
        request.limit = candle_limit;
        request.context.macro = macro;
        auto change = change_24h.find(asset);
        if (change != change_24h.end()) {
            request.context.change_24h = change->second;
        }
        requests.push_back(std::move(request));
    }
    return requests;
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() +
                                              ": " + e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<AppConfig> ConfigLoader::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<AppConfig>(ErrorCode::CONFIG_ERROR,
                                     "Configuration root must be a JSON object", "ConfigLoader");
    }

    AppConfig config;
    try {
        if (j.contains("logging"))
            config.logging.from_json(j.at("logging"));
        if (j.contains("classifier"))
            config.classifier.from_json(j.at("classifier"));
        if (j.contains("batch"))
            config.batch.from_json(j.at("batch"));
        if (j.contains("cache"))
            config.cache.from_json(j.at("cache"));

        if (j.contains("data_directory"))
            config.data_directory = j.at("data_directory").get<std::string>();
        if (j.contains("fallback_directories"))
            config.fallback_directories =
                j.at("fallback_directories").get<std::vector<std::string>>();
        if (j.contains("interval"))
            config.interval = j.at("interval").get<std::string>();
        if (j.contains("candle_limit"))
            config.candle_limit = j.at("candle_limit").get<size_t>();
        if (j.contains("assets"))
            config.assets = j.at("assets").get<std::vector<std::string>>();

        if (j.contains("macro")) {
            const auto& macro = j.at("macro");
            if (macro.contains("fear_greed"))
                config.macro.fear_greed = macro.at("fear_greed").get<int>();
            if (macro.contains("fear_label"))
                config.macro.fear_label = macro.at("fear_label").get<std::string>();
        }
        if (j.contains("change_24h"))
            config.change_24h = j.at("change_24h").get<std::map<std::string, double>>();
    } catch (const nlohmann::json::exception& e) {
        return make_error<AppConfig>(ErrorCode::CONFIG_ERROR,
                                     "Failed to extract config: " + std::string(e.what()),
                                     "ConfigLoader");
    }

    auto validation = validate(config);
    if (validation.is_error()) {
        return make_error<AppConfig>(validation.error()->code(), validation.error()->what(),
                                     "ConfigLoader");
    }

    log_config_summary(config);
    return config;
}

Result<void> ConfigLoader::validate(const AppConfig& config) {
    auto classifier_check = config.classifier.validate();
    if (classifier_check.is_error()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                std::string("classifier: ") + classifier_check.error()->what(),
                                "ConfigLoader");
    }
    if (config.interval.empty()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "interval must not be empty",
                                "ConfigLoader");
    }
    if (config.candle_limit == 0) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "candle_limit must be positive",
                                "ConfigLoader");
    }
    for (const auto& directory : config.fallback_directories) {
        if (directory.empty()) {
            return make_error<void>(ErrorCode::CONFIG_ERROR,
                                    "fallback_directories must not contain empty paths",
                                    "ConfigLoader");
        }
    }
    if (config.macro.fear_greed < 0 || config.macro.fear_greed > 100) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "macro.fear_greed must be in [0, 100]",
                                "ConfigLoader");
    }
    if (config.batch.min_confidence < 0 || config.batch.min_confidence > 100 ||
        config.batch.hold_min_confidence < 0 || config.batch.hold_min_confidence > 100) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "batch confidence floors must be in [0, 100]", "ConfigLoader");
    }
    if (config.batch.critical_buy.score_bound < 0 || config.batch.critical_sell.score_bound > 0) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "critical_buy bound must be >= 0 and critical_sell bound <= 0",
                                "ConfigLoader");
    }
    if (config.cache.minute_ttl_seconds <= 0 || config.cache.hourly_ttl_seconds <= 0 ||
        config.cache.default_ttl_seconds <= 0) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "cache TTLs must be positive",
                                "ConfigLoader");
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    if (!Logger::instance().is_initialized()) {
        return;
    }
    INFO("Config summary: assets=" << config.assets.size() << ", interval=" << config.interval
                                   << ", candle_limit=" << config.candle_limit
                                   << ", data_directory=" << config.data_directory
                                   << ", fallback_directories="
                                   << config.fallback_directories.size());
    INFO("Config summary: min_confidence=" << config.batch.min_confidence
                                           << ", hold_min_confidence="
                                           << config.batch.hold_min_confidence
                                           << ", min_candles=" << config.classifier.min_candles);
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& config_path) {
    auto json_result = load_json_file(config_path);
    if (json_result.is_error()) {
        return make_error<AppConfig>(json_result.error()->code(), json_result.error()->what(),
                                     "ConfigLoader");
    }
    return from_json(json_result.value());
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& defaults_path,
                                     const std::filesystem::path& override_path) {
    auto defaults_result = load_json_file(defaults_path);
    if (defaults_result.is_error()) {
        return make_error<AppConfig>(defaults_result.error()->code(),
                                     "Failed to load defaults: " +
                                         std::string(defaults_result.error()->what()),
                                     "ConfigLoader");
    }
    nlohmann::json merged = defaults_result.value();

    auto override_result = load_json_file(override_path);
    if (override_result.is_error()) {
        return make_error<AppConfig>(override_result.error()->code(),
                                     "Failed to load overrides: " +
                                         std::string(override_result.error()->what()),
                                     "ConfigLoader");
    }
    merge_json(merged, override_result.value());

    return from_json(merged);
}

}  // namespace signal_ngin
