//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.destination = LogDestination::CONSOLE;
        config.min_level = LogLevel::ERR;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

}  // namespace testing
}  // namespace signal_ngin
