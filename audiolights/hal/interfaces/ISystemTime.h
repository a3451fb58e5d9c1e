#pragma once
#include <stdint.h>

/**
 * ISystemTime - Abstract interface for system timing
 *
 * Used by the scheduler, the audio task and the analyzer's staleness check.
 * Enables unit testing with controllable time.
 */
class ISystemTime {
public:
    virtual ~ISystemTime() = default;

    // Timing queries (const - reading time doesn't modify state)
    virtual uint32_t millis() const = 0;
    virtual uint32_t micros() const = 0;

    // Delays
    virtual void delay(uint32_t ms) = 0;
};
