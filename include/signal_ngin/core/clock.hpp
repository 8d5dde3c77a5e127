// include/signal_ngin/core/clock.hpp
#pragma once

#include <chrono>
#include <memory>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Source of the current time
 * Injected wherever time matters (cache freshness, signal timestamps) so tests
 * can drive it explicitly
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current time
     */
    virtual Timestamp now() const = 0;
};

/**
 * @brief Wall clock backed by std::chrono::system_clock
 */
class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }

    static std::shared_ptr<Clock> shared() {
        static std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
        return instance;
    }
};

}  // namespace signal_ngin
