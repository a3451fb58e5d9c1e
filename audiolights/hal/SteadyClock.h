#pragma once
#include "interfaces/ISystemTime.h"
#include <chrono>

/**
 * SteadyClock - ISystemTime backed by std::chrono::steady_clock
 *
 * Time starts at zero when the clock is constructed.
 */
class SteadyClock : public ISystemTime {
public:
    SteadyClock() : start_(std::chrono::steady_clock::now()) {}

    uint32_t millis() const override {
        return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

    uint32_t micros() const override {
        return (uint32_t)std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

    void delay(uint32_t ms) override;

private:
    std::chrono::steady_clock::time_point start_;
};
