#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

using namespace signal_ngin;

class ResultTest : public ::testing::Test {};

// Test successful Result with different types
TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    CandleSeries candles{Candle(Timestamp{}, 1.0, 2.0, 0.5, 1.5, 10.0)};
    Result<CandleSeries> series_result(candles);
    ASSERT_TRUE(series_result.is_ok());
    ASSERT_EQ(series_result.value().size(), 1u);
    EXPECT_DOUBLE_EQ(series_result.value()[0].close, 1.5);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::INVALID_ARGUMENT, "Test error message", "TestComponent");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_STREQ(error_result.error()->what(), "Test error message");
    EXPECT_EQ(error_result.error()->component(), "TestComponent");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<CandleSeries>(ErrorCode::FILE_NOT_FOUND, "missing", "Provider");
    EXPECT_THROW(error_result.value(), SignalError);

    auto void_error = make_error<void>(ErrorCode::CONFIG_ERROR, "bad", "Loader");
    EXPECT_THROW(void_error.value(), SignalError);
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::string> str_result(std::string("test"));
    Result<std::string> moved_str = std::move(str_result);

    EXPECT_TRUE(moved_str.is_ok());
    EXPECT_EQ(moved_str.value(), "test");

    auto error_result = make_error<std::string>(ErrorCode::TIMEOUT_ERROR, "slow", "Fetch");
    Result<std::string> moved_error = std::move(error_result);
    ASSERT_TRUE(moved_error.is_error());
    EXPECT_EQ(moved_error.error()->code(), ErrorCode::TIMEOUT_ERROR);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_FALSE(error.is_ok());
}

TEST_F(ResultTest, ErrorToString) {
    SignalError error(ErrorCode::JSON_PARSE_ERROR, "unexpected token", "ConfigLoader");
    EXPECT_EQ(error.to_string(),
              "Error in ConfigLoader: unexpected token (Code: JSON_PARSE_ERROR)");
    EXPECT_EQ(error_code_to_string(ErrorCode::FILE_NOT_FOUND), "FILE_NOT_FOUND");
    EXPECT_EQ(error_code_to_string(ErrorCode::CONFIG_ERROR), "CONFIG_ERROR");
}

TEST_F(ResultTest, EveryCodeHasAName) {
    const std::vector<std::pair<ErrorCode, std::string>> codes{
        {ErrorCode::NONE, "NONE"},
        {ErrorCode::UNKNOWN_ERROR, "UNKNOWN_ERROR"},
        {ErrorCode::INVALID_ARGUMENT, "INVALID_ARGUMENT"},
        {ErrorCode::INVALID_DATA, "INVALID_DATA"},
        {ErrorCode::CONNECTION_ERROR, "CONNECTION_ERROR"},
        {ErrorCode::TIMEOUT_ERROR, "TIMEOUT_ERROR"},
        {ErrorCode::API_ERROR, "API_ERROR"},
        {ErrorCode::FILE_NOT_FOUND, "FILE_NOT_FOUND"},
        {ErrorCode::FILE_IO_ERROR, "FILE_IO_ERROR"},
        {ErrorCode::JSON_PARSE_ERROR, "JSON_PARSE_ERROR"},
        {ErrorCode::CONFIG_ERROR, "CONFIG_ERROR"}};

    for (const auto& [code, name] : codes) {
        EXPECT_EQ(error_code_to_string(code), name);
    }
    EXPECT_EQ(error_code_to_string(ErrorCode::CUSTOM_ERROR_START), "CUSTOM_ERROR");
}
