#include "LightScheduler.h"
#include "../config/DebugLog.h"
#include "../patterns/ColorMath.h"
#include <string>

namespace {
    // Longest single sleep inside run(); bounds stop latency
    constexpr uint32_t MAX_SLEEP_SLICE_MS = 10;
}

LightScheduler::LightScheduler(const LightLayout& layout, PatternEngine& engine,
                               ILightTransport& transport, SnapshotCell& audio, ISystemTime& time)
    : layout_(layout)
    , engine_(engine)
    , transport_(transport)
    , audio_(audio)
    , time_(time)
    , sessionStartMs_(0)
    , nextTickMs_(0.0)
    , periodMs_(1000.0 / 30.0)
    , lastTickSec_(0.0f)
    , yaw_(0.0f)
    , lastFailureLogMs_(0)
    , suppressedFailures_(0)
    , loggedAnyFailure_(false)
    , state_((uint8_t)SchedulerState::IDLE)
    , pendingPattern_(-1)
    , activePattern_((int)PatternType::CHASE)
    , stopRequested_(false)
    , ticks_(0)
    , updatesSent_(0)
    , updateFailures_(0)
    , lateTicks_(0)
    , patternSwitches_(0)
    , lightsCreated_(0)
    , lightsRemoved_(0)
    , removeFailures_(0)
{
}

const char* LightScheduler::stateName(SchedulerState s) {
    switch (s) {
        case SchedulerState::IDLE:       return "idle";
        case SchedulerState::RUNNING:    return "running";
        case SchedulerState::STOPPING:   return "stopping";
        case SchedulerState::TERMINATED: return "terminated";
        default:                         return "unknown";
    }
}

Result LightScheduler::begin(const SchedulerParams& params, PatternType initialPattern) {
    if (state() != SchedulerState::IDLE) {
        return Result::fail(ErrorKind::CONFIGURATION, "scheduler already started");
    }
    if (!(params.updateRate > 0.0f)) {
        return Result::fail(ErrorKind::CONFIGURATION, "update rate must be positive");
    }
    if (layout_.isEmpty()) {
        return Result::fail(ErrorKind::CONFIGURATION,
                            "no lights in layout; add counts for left, right, front, back, top or bottom");
    }
    if (!engine_.isValid()) {
        return Result::fail(ErrorKind::CONFIGURATION, "pattern engine not initialized");
    }

    params_ = params;
    periodMs_ = 1000.0 / params_.updateRate;

    const int n = layout_.total();
    handles_.assign(n, INVALID_LIGHT_HANDLE);
    lastSent_.assign(n, LightFrame());
    sentValid_.assign(n, false);
    frame_.resize(n);

    int attempts = params_.createRetries > 0 ? params_.createRetries : 1;
    for (int i = 0; i < n; i++) {
        const LightDescriptor& d = layout_.descriptor(i);
        bool created = false;
        for (int a = 0; a < attempts && !created; a++) {
            LightHandle h = INVALID_LIGHT_HANDLE;
            if (transport_.createLight(d, layout_.position(i), h) && h != INVALID_LIGHT_HANDLE) {
                handles_[i] = h;
                created = true;
            } else {
                DEBUG_WARN_F("Create failed for %s light %d (attempt %d/%d)\n",
                             ZoneInfo::name(d.zone), d.zoneIndex, a + 1, attempts);
            }
        }
        if (!created) {
            DEBUG_ERROR_F("Giving up on light %d; removing %d created lights\n", i, i);
            removeCreated(time_.millis(), params_.teardownTimeoutMs);
            handles_.clear();
            return Result::fail(ErrorKind::TRANSPORT,
                                "could not create light " + std::to_string(i) + " after " +
                                std::to_string(attempts) + " attempts");
        }
        lightsCreated_++;
    }

    sessionStartMs_ = time_.millis();
    nextTickMs_ = 0.0;
    lastTickSec_ = 0.0f;
    yaw_ = 0.0f;
    engine_.setPattern(initialPattern, 0.0f);
    activePattern_ = (int)initialPattern;
    pendingPattern_ = -1;
    setState(SchedulerState::RUNNING);

    DEBUG_INFO_F("Created %d lights, pattern %s, %.0f Hz\n", n,
                 PatternTypes::name(initialPattern), params_.updateRate);
    return Result::ok();
}

float LightScheduler::sessionSeconds() const {
    return (time_.millis() - sessionStartMs_) / 1000.0f;
}

void LightScheduler::requestPattern(PatternType type) {
    pendingPattern_ = (int)type;
}

Result LightScheduler::requestPatternByName(const char* nameOrIndex) {
    PatternType type;
    if (!PatternTypes::parse(nameOrIndex, type)) {
        return Result::fail(ErrorKind::PATTERN,
                            std::string("unknown pattern: ") + (nameOrIndex ? nameOrIndex : ""));
    }
    requestPattern(type);
    return Result::ok();
}

void LightScheduler::tick() {
    tickAt(time_.millis());
}

void LightScheduler::run(uint32_t maxDurationMs) {
    while (state() == SchedulerState::RUNNING && !stopRequested_.load()) {
        uint32_t now = time_.millis();
        double elapsed = (double)(now - sessionStartMs_);

        if (maxDurationMs > 0 && elapsed >= maxDurationMs) {
            break;
        }

        if (elapsed >= nextTickMs_) {
            if (elapsed - nextTickMs_ > periodMs_) {
                // Fell behind by more than a period: resync instead of bursting
                lateTicks_++;
                DEBUG_VERBOSE_F("Tick late by %.0f ms, resyncing\n", elapsed - nextTickMs_);
                nextTickMs_ = elapsed;
            }
            tickAt(sessionStartMs_ + (uint32_t)nextTickMs_);
            nextTickMs_ += periodMs_;
        } else {
            uint32_t wait = (uint32_t)(nextTickMs_ - elapsed) + 1;
            time_.delay(wait < MAX_SLEEP_SLICE_MS ? wait : MAX_SLEEP_SLICE_MS);
        }
    }
}

void LightScheduler::tickAt(uint32_t scheduledMs) {
    if (state() != SchedulerState::RUNNING) return;

    // Pattern time follows the schedule, not the wakeup, so output is jitter-free
    float sessionSec = (scheduledMs - sessionStartMs_) / 1000.0f;

    applyPendingPattern(sessionSec);

    AudioSnapshot snapshot = audio_.readFresh(time_.millis(), params_.snapshotMaxAgeMs);
    engine_.step(snapshot, sessionSec, frame_);
    applyRotation(snapshot, sessionSec);
    sendChanged(time_.millis());

    lastTickSec_ = sessionSec;
    ticks_++;
}

void LightScheduler::applyPendingPattern(float sessionSec) {
    int pending = pendingPattern_.exchange(-1);
    if (pending < 0) return;

    PatternType type = (PatternType)pending;
    if (engine_.setPattern(type, sessionSec)) {
        activePattern_ = pending;
        patternSwitches_++;
        DEBUG_INFO_F("Pattern: %s\n", PatternTypes::name(type));
    }
}

void LightScheduler::applyRotation(const AudioSnapshot& audio, float sessionSec) {
    if (!params_.rotationEnabled) return;

    float dt = sessionSec - lastTickSec_;
    if (dt < 0.0f) dt = 0.0f;
    float speed = params_.rotationSpeed;
    if (params_.rotationAudioBoost) {
        speed *= 1.0f + ColorMath::clamp01(audio.low);
    }
    yaw_ = ColorMath::wrapHue(yaw_ + speed * dt);

    for (int i = 0; i < frame_.size(); i++) {
        LightFrame& f = frame_.get(i);
        if (!f.hasRotation) {
            f.hasRotation = true;
            f.yawDegrees = yaw_;
        }
    }
}

void LightScheduler::sendChanged(uint32_t nowMs) {
    uint32_t failures = 0;

    for (int i = 0; i < frame_.size(); i++) {
        LightFrame& f = frame_.get(i);
        f.clamp();

        if (sentValid_[i] && f.approxEquals(lastSent_[i], params_.changeEpsilon)) {
            continue;
        }

        if (transport_.updateLight(handles_[i], f)) {
            lastSent_[i] = f;
            sentValid_[i] = true;
            updatesSent_++;
        } else {
            // Unknown remote state: resend next tick
            sentValid_[i] = false;
            updateFailures_++;
            failures++;
        }
    }

    if (failures == 0) return;

    if (!loggedAnyFailure_ || nowMs - lastFailureLogMs_ >= params_.failureLogIntervalMs) {
        DEBUG_WARN_F("%u light updates failed this tick (%u suppressed since last report)\n",
                     failures, suppressedFailures_);
        lastFailureLogMs_ = nowMs;
        loggedAnyFailure_ = true;
        suppressedFailures_ = 0;
    } else {
        suppressedFailures_ += failures;
    }
}

void LightScheduler::removeCreated(uint32_t startMs, uint32_t timeoutMs) {
    std::vector<int> pending;
    for (size_t i = 0; i < handles_.size(); i++) {
        if (handles_[i] != INVALID_LIGHT_HANDLE) {
            pending.push_back((int)i);
        }
    }

    int passes = 1 + (params_.removeRetries > 0 ? params_.removeRetries : 0);
    bool timedOut = false;

    for (int pass = 0; pass < passes && !pending.empty() && !timedOut; pass++) {
        std::vector<int> failed;
        for (size_t k = 0; k < pending.size(); k++) {
            if (time_.millis() - startMs >= timeoutMs) {
                timedOut = true;
                failed.insert(failed.end(), pending.begin() + k, pending.end());
                break;
            }
            int i = pending[k];
            if (transport_.removeLight(handles_[i])) {
                handles_[i] = INVALID_LIGHT_HANDLE;
                lightsRemoved_++;
            } else {
                removeFailures_++;
                failed.push_back(i);
            }
        }
        pending.swap(failed);
    }

    if (!pending.empty()) {
        DEBUG_WARN_F("%u lights could not be removed%s\n", (unsigned)pending.size(),
                     timedOut ? " before the teardown timeout" : "");
    }
}

int LightScheduler::shutdown() {
    SchedulerState s = state();
    if (s == SchedulerState::TERMINATED || s == SchedulerState::STOPPING) {
        return 0;
    }
    if (s == SchedulerState::IDLE) {
        setState(SchedulerState::TERMINATED);
        return 0;
    }

    setState(SchedulerState::STOPPING);
    uint32_t before = lightsRemoved_.load();
    uint32_t start = time_.millis();

    removeCreated(start, params_.teardownTimeoutMs);

    setState(SchedulerState::TERMINATED);
    int removed = (int)(lightsRemoved_.load() - before);
    DEBUG_INFO_F("Teardown: removed %d of %d lights in %u ms\n", removed, layout_.total(),
                 time_.millis() - start);
    return removed;
}

SchedulerStats LightScheduler::stats() const {
    SchedulerStats s;
    s.ticks = ticks_.load();
    s.updatesSent = updatesSent_.load();
    s.updateFailures = updateFailures_.load();
    s.lateTicks = lateTicks_.load();
    s.patternSwitches = patternSwitches_.load();
    s.lightsCreated = lightsCreated_.load();
    s.lightsRemoved = lightsRemoved_.load();
    s.removeFailures = removeFailures_.load();
    return s;
}
