#pragma once

#include <stdint.h>

/**
 * AudioSnapshot - Latest published result of audio analysis
 *
 * Patterns receive this struct and don't need to know about:
 * - Window buffering and FFT
 * - Running-max normalization
 * - Attack/release smoothing
 * - Beat detection history
 *
 * Immutable once published. Every energy is finite and in [0, 1].
 */
struct AudioSnapshot {
    // === BAND ENERGIES ===
    // Normalized and smoothed energy per frequency band (0.0 - 1.0)
    float low = 0.0f;       // Bass (default 20-250 Hz)
    float mid = 0.0f;       // Mids (default 250-2000 Hz)
    float high = 0.0f;      // Treble (default 2000-20000 Hz)

    // Whole-spectrum loudness, same pipeline as the bands (0.0 - 1.0)
    float overall = 0.0f;

    // === BEAT ===
    // True on the analysis frame where a beat pulse fired
    bool beat = false;

    // Pulses since analysis started. Readers that sample slower than the
    // analysis cadence compare counts to see pulses they would otherwise miss.
    uint32_t beatCount = 0;

    // ISystemTime::millis() when published; used for staleness checks
    uint32_t timestampMs = 0;

    static AudioSnapshot silence(uint32_t nowMs = 0, uint32_t beatCount = 0) {
        AudioSnapshot s;
        s.timestampMs = nowMs;
        s.beatCount = beatCount;
        return s;
    }

    bool isSilent() const {
        const float eps = 1e-4f;
        return !beat && low < eps && mid < eps && high < eps && overall < eps;
    }
};
