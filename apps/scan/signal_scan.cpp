#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "signal_ngin/core/config_loader.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/data/caching_candle_provider.hpp"
#include "signal_ngin/data/candle_cache.hpp"
#include "signal_ngin/data/fallback_candle_provider.hpp"
#include "signal_ngin/data/file_candle_provider.hpp"
#include "signal_ngin/signal/batch_processor.hpp"
#include "signal_ngin/signal/signal_classifier.hpp"

using namespace signal_ngin;

namespace {

// The primary directory, then each fallback directory in order
std::shared_ptr<data::CandleProvider> make_file_sources(const AppConfig& config) {
    auto primary = std::make_shared<data::FileCandleProvider>(config.data_directory);
    if (config.fallback_directories.empty()) {
        return primary;
    }

    std::vector<std::shared_ptr<data::CandleProvider>> sources{primary};
    for (const auto& directory : config.fallback_directories) {
        sources.push_back(std::make_shared<data::FileCandleProvider>(directory));
    }
    return std::make_shared<data::FallbackCandleProvider>(std::move(sources));
}

nlohmann::json signals_to_json(const std::vector<Signal>& signals) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& signal : signals) {
        j.push_back(signal.to_json());
    }
    return j;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> positional;
        bool print_all = false;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--all") {
                print_all = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [config.json] [overrides.json] [--all]"
                          << std::endl;
                return 0;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.size() > 2) {
            std::cerr << "Too many arguments" << std::endl;
            std::cerr << "Usage: " << argv[0] << " [config.json] [overrides.json] [--all]"
                      << std::endl;
            return 1;
        }

        const std::string config_path =
            positional.empty() ? "config/signal_scan.json" : positional[0];
        const std::string override_path = positional.size() > 1 ? positional[1] : "";

        auto config_result = override_path.empty()
                                 ? ConfigLoader::load(config_path)
                                 : ConfigLoader::load(config_path, override_path);
        if (config_result.is_error()) {
            std::cerr << "Failed to load config: " << config_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        const AppConfig config = config_result.value();

        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("SignalScan");
        INFO("Scanning " << config.assets.size() << " assets on " << config.interval
                         << " candles from " << config.data_directory);

        if (config.assets.empty()) {
            WARN("No assets configured, nothing to scan");
        }

        auto clock = SystemClock::shared();
        auto files = make_file_sources(config);
        auto cache = std::make_shared<data::InMemoryCandleCache>(clock);
        data::CachingCandleProvider provider(files, cache, clock, config.cache);

        auto classifier = std::make_shared<const SignalClassifier>(config.classifier, clock);
        BatchProcessor processor(classifier, config.batch);

        BatchResult result = processor.process_from_provider(provider, config.asset_requests());

        nlohmann::json output;
        output["signals"] = signals_to_json(result.signals);
        output["critical"] = signals_to_json(result.critical);
        if (print_all) {
            output["all"] = signals_to_json(result.all);
        }
        std::cout << output.dump(2) << std::endl;

        INFO("Scan complete: " << result.signals.size() << " signals, " << result.critical.size()
                               << " critical");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
