#include "LightsConfig.h"
#include "../patterns/PatternType.h"
#include <stdio.h>
#include <strings.h>

namespace {
    constexpr int MAX_LIGHTS_PER_ZONE = 512;
    constexpr float MAX_UPDATE_RATE = 240.0f;

    Result bad(const char* field, const char* why) {
        char buf[160];
        snprintf(buf, sizeof(buf), "%s %s", field, why);
        return Result::fail(ErrorKind::CONFIGURATION, buf);
    }

    bool finite(float x) {
        return (x == x) && (x >= -3.4e38f) && (x <= 3.4e38f);
    }
}

LightsConfig::LightsConfig() : defaultPattern("chase") {
    const int defaults[NUM_ZONES] = {5, 5, 3, 2, 4, 0};
    for (int z = 0; z < NUM_ZONES; z++) {
        zoneCounts[z] = defaults[z];
    }
}

int LightsConfig::totalLights() const {
    int total = 0;
    for (int z = 0; z < NUM_ZONES; z++) {
        if (zoneCounts[z] > 0) total += zoneCounts[z];
    }
    return total;
}

Result LightsConfig::validate() const {
    // Layout
    for (int z = 0; z < NUM_ZONES; z++) {
        const char* zone = ZoneInfo::name(ZoneInfo::fromIndex(z));
        if (zoneCounts[z] < 0) return bad(zone, "count must not be negative");
        if (zoneCounts[z] > MAX_LIGHTS_PER_ZONE) return bad(zone, "count is too large");
    }
    if (totalLights() == 0) {
        return Result::fail(ErrorKind::CONFIGURATION,
                            "no lights in layout; example: layout: {left: 5, right: 5, front: 3, back: 2, top: 4}");
    }
    if (!finite(geometry.center.x) || !finite(geometry.center.y) || !finite(geometry.center.z)) {
        return bad("center", "must be finite");
    }
    if (!(geometry.spacing >= 0.0f) || !finite(geometry.spacing)) return bad("spacing", "must be >= 0");
    if (!(geometry.radius >= 0.0f) || !finite(geometry.radius)) return bad("radius", "must be >= 0");

    // Patterns
    PatternType type;
    if (!PatternTypes::fromName(defaultPattern.c_str(), type)) {
        return Result::fail(ErrorKind::CONFIGURATION, "unknown default_pattern: " + defaultPattern);
    }
    if (patterns.chaseTail < 1) return bad("chase_tail", "must be >= 1");
    if (!(patterns.chaseStep > 0.0f)) return bad("chase_step", "must be > 0");
    if (!(patterns.swirlRate > 0.0f)) return bad("swirl_rate", "must be > 0");
    if (!(patterns.sweepRate > 0.0f)) return bad("sweep_rate", "must be > 0");
    if (!(patterns.altPeriod > 0.0f)) return bad("alt_period", "must be > 0");
    if (!(patterns.centerPeriod > 0.0f)) return bad("center_period", "must be > 0");
    if (!(patterns.breathPeriod > 0.0f)) return bad("breath_period", "must be > 0");
    if (!(patterns.zoneMixCycle > 0.0f)) return bad("zone_mix_cycle", "must be > 0");
    if (!(patterns.idleIntensity >= 0.0f && patterns.idleIntensity <= 1.0f)) {
        return bad("idle_intensity", "must be in [0, 1]");
    }

    // Scheduler
    if (!(scheduler.updateRate > 0.0f) || scheduler.updateRate > MAX_UPDATE_RATE) {
        return bad("update_rate", "must be in (0, 240]");
    }
    if (scheduler.createRetries < 1) return bad("create_retries", "must be >= 1");
    if (scheduler.removeRetries < 0) return bad("remove_retries", "must be >= 0");
    if (scheduler.teardownTimeoutMs == 0) return bad("teardown_timeout_ms", "must be > 0");
    if (!finite(scheduler.rotationSpeed)) return bad("rotation_speed", "must be finite");

    // Analyzer
    const AnalyzerParams& a = analyzer;
    if (!(a.sampleRate >= 8000.0f && a.sampleRate <= 192000.0f)) {
        return bad("sample_rate", "must be in [8000, 192000]");
    }
    if (!SpectralBands::isPowerOfTwo(a.windowSize) ||
        a.windowSize < SpectralConstants::MIN_WINDOW_SIZE ||
        a.windowSize > SpectralConstants::MAX_WINDOW_SIZE) {
        return bad("window", "must be a power of two in [64, 8192]");
    }
    if (a.hopSize < 1 || a.hopSize > a.windowSize) return bad("hop", "must be in [1, window]");
    if (!(a.minHz >= 0.0f && a.minHz < a.lowHz && a.lowHz < a.midHz && a.midHz < a.maxHz)) {
        return bad("band edges", "must satisfy min_hz < low_hz < mid_hz < max_hz");
    }
    if (!(a.lowHz < a.sampleRate * 0.5f)) return bad("low_hz", "must be below Nyquist");
    if (!(a.normDecayTau > 0.0f)) return bad("norm_decay", "must be > 0");
    if (!(a.attackTau >= 0.0f)) return bad("attack", "must be >= 0");
    if (!(a.releaseTau >= 0.0f)) return bad("release", "must be >= 0");
    if (!(a.beatThreshold >= 1.0f)) return bad("beat_threshold", "must be >= 1");
    if (!(a.beatWindow > 0.0f)) return bad("beat_window", "must be > 0");
    if (!(a.beatMinEnergy >= 0.0f && a.beatMinEnergy <= 1.0f)) return bad("beat_min_energy", "must be in [0, 1]");
    if (a.silenceTimeoutMs == 0) return bad("silence_timeout_ms", "must be > 0");

    // Audio source
    if (audio.kind == AudioSourceKind::FILE && audio.path.empty()) {
        return bad("audio.path", "is required for a file source");
    }
    if (audio.kind == AudioSourceKind::PIPE && audio.command.empty()) {
        return bad("audio.command", "is required for a pipe source");
    }
    if (audio.kind == AudioSourceKind::TONE && !(audio.toneBpm > 0.0f && audio.toneBpm <= 400.0f)) {
        return bad("audio.tone_bpm", "must be in (0, 400]");
    }

    // Transport
    if (!(transport.intensityScale > 0.0f)) return bad("intensity_scale", "must be > 0");
    if (!(transport.lightRange > 0.0f)) return bad("light_range", "must be > 0");
    if (transport.output.empty()) return bad("output", "must not be empty");

    return Result::ok();
}

const char* LightsConfig::audioSourceName(AudioSourceKind kind) {
    switch (kind) {
        case AudioSourceKind::NONE: return "none";
        case AudioSourceKind::FILE: return "file";
        case AudioSourceKind::PIPE: return "pipe";
        case AudioSourceKind::TONE: return "tone";
        default:                    return "unknown";
    }
}

bool LightsConfig::audioSourceFromName(const char* name, AudioSourceKind& out) {
    if (!name) return false;
    const AudioSourceKind kinds[] = {
        AudioSourceKind::NONE, AudioSourceKind::FILE, AudioSourceKind::PIPE, AudioSourceKind::TONE
    };
    for (size_t i = 0; i < sizeof(kinds) / sizeof(kinds[0]); i++) {
        if (strcasecmp(name, audioSourceName(kinds[i])) == 0) {
            out = kinds[i];
            return true;
        }
    }
    return false;
}
