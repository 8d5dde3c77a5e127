// include/signal_ngin/indicators/indicator_result.hpp
#pragma once

#include <utility>

namespace signal_ngin {
namespace indicators {

/**
 * @brief Whether an indicator had enough input to produce a real reading
 */
enum class DataStatus {
    SUFFICIENT,   // Value computed from the input
    INSUFFICIENT  // Input too short, value is the indicator's documented sentinel
};

/**
 * @brief Tagged indicator output
 *
 * Indicators never throw on short input. They return their neutral sentinel
 * (RSI 50, zero MACD, collapsed bands...) tagged INSUFFICIENT so callers can tell
 * a real reading from a placeholder without inspecting the value.
 *
 * @tparam T Value type of the indicator
 */
template <typename T>
struct IndicatorResult {
    T value{};
    DataStatus status{DataStatus::INSUFFICIENT};

    bool is_sufficient() const {
        return status == DataStatus::SUFFICIENT;
    }

    static IndicatorResult sufficient(T v) {
        return IndicatorResult{std::move(v), DataStatus::SUFFICIENT};
    }

    static IndicatorResult insufficient(T sentinel = T{}) {
        return IndicatorResult{std::move(sentinel), DataStatus::INSUFFICIENT};
    }
};

}  // namespace indicators
}  // namespace signal_ngin
