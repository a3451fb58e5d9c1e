#pragma once

#include <atomic>
#include <stdint.h>

/**
 * LightsAssert - Non-fatal runtime assertions.
 *
 * Unexpected conditions are bugs, but a live show must keep running.
 * LIGHTS_ASSERT makes them visible without stopping the process.
 *
 * Behavior:
 * - Logs the message to stderr
 * - Increments a global failure counter (shown by the "status" command)
 * - NEVER aborts; the caller still provides the safe fallback
 *
 * Usage:
 *   LIGHTS_ASSERT(index >= 0 && index < count_, "OOB light index in setLight");
 */
namespace LightsAssert {
    // Monotonically increasing, shared by the audio and scheduler threads
    extern std::atomic<uint32_t> failCount;

    void onFail(const char* msg, const char* file, int line);
}

#define LIGHTS_ASSERT(cond, msg) \
    do { if (!(cond)) ::LightsAssert::onFail(msg, __FILE__, __LINE__); } while(0)
