// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/data/caching_candle_provider.hpp"
#include "signal_ngin/signal/batch_processor.hpp"
#include "signal_ngin/signal/signal_classifier.hpp"

using namespace signal_ngin;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "signal_ngin_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigBaseTest, SaveAndLoadClassifierConfig) {
    ClassifierConfig config;
    config.rsi_period = 10;
    config.macd_fast = 8;
    config.bollinger_std_dev = 2.5;
    config.min_candles = 80;

    std::filesystem::path file_path = test_dir / "classifier.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << "Failed to save config: "
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    ClassifierConfig loaded;
    auto load_result = loaded.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << "Failed to load config: "
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_EQ(loaded.rsi_period, 10);
    EXPECT_EQ(loaded.macd_fast, 8);
    EXPECT_EQ(loaded.macd_slow, 26);
    EXPECT_DOUBLE_EQ(loaded.bollinger_std_dev, 2.5);
    EXPECT_EQ(loaded.min_candles, 80u);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    BatchFilterConfig config;

    nlohmann::json partial;
    partial["min_confidence"] = 40;
    partial["critical_sell"] = {{"score_bound", -50}};
    config.from_json(partial);

    EXPECT_EQ(config.min_confidence, 40);
    EXPECT_EQ(config.hold_min_confidence, 50);
    EXPECT_EQ(config.critical_buy.min_confidence, 60);
    EXPECT_EQ(config.critical_buy.score_bound, 35);
    EXPECT_EQ(config.critical_sell.min_confidence, 60);
    EXPECT_EQ(config.critical_sell.score_bound, -50);
}

TEST_F(ConfigBaseTest, MissingFileHandling) {
    data::CacheConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    data::CacheConfig config;

    std::filesystem::path file_path = test_dir / "invalid.json";
    std::ofstream file(file_path);
    file << "{ this is not valid JSON }";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, WrongValueTypeHandling) {
    ClassifierConfig config;

    std::filesystem::path file_path = test_dir / "wrong_type.json";
    std::ofstream file(file_path);
    file << R"({"rsi_period": "fourteen"})";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIG_ERROR);
}

TEST_F(ConfigBaseTest, CacheTtlByInterval) {
    data::CacheConfig config;
    EXPECT_EQ(config.ttl_for("1m"), std::chrono::seconds(60));
    EXPECT_EQ(config.ttl_for("15m"), std::chrono::seconds(60));
    EXPECT_EQ(config.ttl_for("1h"), std::chrono::seconds(300));
    EXPECT_EQ(config.ttl_for("4h"), std::chrono::seconds(300));
    EXPECT_EQ(config.ttl_for("1d"), std::chrono::seconds(300));

    config.from_json({{"hourly_ttl_seconds", 120}});
    EXPECT_EQ(config.ttl_for("1h"), std::chrono::seconds(120));
    EXPECT_EQ(config.to_json().at("minute_ttl_seconds"), 60);
}
