#pragma once

#include "LightFrame.h"
#include "../layout/LightLayout.h"
#include "../patterns/PatternEngine.h"
#include "../audio/SnapshotCell.h"
#include "../hal/interfaces/ILightTransport.h"
#include "../hal/interfaces/ISystemTime.h"
#include "../types/Result.h"
#include <atomic>
#include <vector>

enum class SchedulerState : uint8_t {
    IDLE,         // Constructed, no lights exist
    RUNNING,      // Lights created, ticking
    STOPPING,     // Removing lights
    TERMINATED    // Done; begin() may not be called again
};

/**
 * SchedulerParams - Loop cadence, retry counts and global rotation
 */
struct SchedulerParams {
    float updateRate;              // Ticks per second
    int createRetries;             // Attempts per light at startup
    int removeRetries;             // Extra passes over lights whose removal failed
    uint32_t teardownTimeoutMs;    // Hard bound on shutdown()
    float changeEpsilon;           // Per-channel difference that counts as a change
    uint32_t snapshotMaxAgeMs;     // Older snapshots read as silence
    uint32_t failureLogIntervalMs; // Rate limit for per-tick transport warnings

    // Whole-rig yaw, applied to lights whose pattern sets no rotation
    bool rotationEnabled;
    float rotationSpeed;           // Degrees per second
    bool rotationAudioBoost;       // Speed scaled by (1 + low)

    SchedulerParams() {
        updateRate = 30.0f;
        createRetries = 3;
        removeRetries = 2;
        teardownTimeoutMs = 2000;
        changeEpsilon = 1e-3f;
        snapshotMaxAgeMs = 500;
        failureLogIntervalMs = 1000;
        rotationEnabled = false;
        rotationSpeed = 30.0f;
        rotationAudioBoost = true;
    }
};

/**
 * SchedulerStats - Counters for the "status" command
 */
struct SchedulerStats {
    uint32_t ticks = 0;
    uint32_t updatesSent = 0;
    uint32_t updateFailures = 0;
    uint32_t lateTicks = 0;
    uint32_t patternSwitches = 0;
    uint32_t lightsCreated = 0;
    uint32_t lightsRemoved = 0;
    uint32_t removeFailures = 0;
};

/**
 * LightScheduler - Fixed-cadence update loop and light lifecycle owner
 *
 * Every tick:
 *   1. Apply a pending pattern switch
 *   2. Read the latest snapshot (stale -> silence)
 *   3. Step the active pattern, apply global rotation
 *   4. Clamp, diff against what each light last received, send changes
 *
 * A failed update leaves that light marked unknown so it is resent on the
 * next tick. Only startup creation failures are fatal.
 *
 * requestPattern(), requestStop(), state() and stats() may be called from
 * other threads; everything else belongs to the thread that runs the loop.
 */
class LightScheduler {
public:
    LightScheduler(const LightLayout& layout, PatternEngine& engine,
                   ILightTransport& transport, SnapshotCell& audio, ISystemTime& time);

    /**
     * Idle -> Running. Creates every light in layout order.
     * Fails with CONFIGURATION for an empty layout or bad rate and with
     * TRANSPORT when a light cannot be created after all retries (lights
     * created so far are removed again).
     */
    Result begin(const SchedulerParams& params, PatternType initialPattern);

    // One tick at the current time
    void tick();

    /**
     * Tick at the configured rate until requestStop() (or maxDurationMs
     * of session time, if non-zero). Sleeps in short slices so a stop is
     * seen within one tick period.
     */
    void run(uint32_t maxDurationMs = 0);

    void requestStop() { stopRequested_ = true; }
    bool stopRequested() const { return stopRequested_.load(); }

    // Queue a switch for the start of the next tick
    void requestPattern(PatternType type);
    Result requestPatternByName(const char* nameOrIndex);

    /**
     * Running -> Stopping -> Terminated. Removes every created light with
     * bounded retries and returns within teardownTimeoutMs regardless of
     * transport behaviour.
     * @return number of lights removed
     */
    int shutdown();

    SchedulerState state() const { return (SchedulerState)state_.load(); }
    static const char* stateName(SchedulerState s);

    PatternType activePattern() const { return (PatternType)activePattern_.load(); }
    SchedulerStats stats() const;
    float rotationYaw() const { return yaw_; }
    float sessionSeconds() const;

    // Last frame handed to the transport per light (tests, status)
    const LightFrameBuffer& lastFrame() const { return frame_; }

private:
    void tickAt(uint32_t scheduledMs);
    void applyPendingPattern(float sessionSec);
    void applyRotation(const AudioSnapshot& audio, float sessionSec);
    void sendChanged(uint32_t nowMs);
    void removeCreated(uint32_t deadlineStartMs, uint32_t timeoutMs);
    void setState(SchedulerState s) { state_ = (uint8_t)s; }

    const LightLayout& layout_;
    PatternEngine& engine_;
    ILightTransport& transport_;
    SnapshotCell& audio_;
    ISystemTime& time_;
    SchedulerParams params_;

    std::vector<LightHandle> handles_;
    std::vector<LightFrame> lastSent_;
    std::vector<bool> sentValid_;     // false = never sent or last send failed
    LightFrameBuffer frame_;

    uint32_t sessionStartMs_;
    double nextTickMs_;               // Relative to sessionStartMs_
    double periodMs_;
    float lastTickSec_;
    float yaw_;

    // Rate-limited failure logging
    uint32_t lastFailureLogMs_;
    uint32_t suppressedFailures_;
    bool loggedAnyFailure_;

    std::atomic<uint8_t> state_;
    std::atomic<int> pendingPattern_;   // -1 = none
    std::atomic<int> activePattern_;
    std::atomic<bool> stopRequested_;

    // Counters read by other threads
    std::atomic<uint32_t> ticks_;
    std::atomic<uint32_t> updatesSent_;
    std::atomic<uint32_t> updateFailures_;
    std::atomic<uint32_t> lateTicks_;
    std::atomic<uint32_t> patternSwitches_;
    std::atomic<uint32_t> lightsCreated_;
    std::atomic<uint32_t> lightsRemoved_;
    std::atomic<uint32_t> removeFailures_;

    // Prevent copying
    LightScheduler(const LightScheduler&) = delete;
    LightScheduler& operator=(const LightScheduler&) = delete;
};
