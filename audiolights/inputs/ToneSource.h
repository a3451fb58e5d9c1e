#pragma once

#include "../hal/interfaces/IAudioSource.h"
#include "../hal/interfaces/ISystemTime.h"
#include <stdint.h>
#include <string>

/**
 * ToneSource - Synthetic dance-loop test signal
 *
 * A decaying low sine kick on every beat, a mid chord pad and a short
 * noise hi-hat on the off-beats. Deterministic: the same BPM and rate give
 * the same samples. Used for demos without a capture device and in tests.
 */
class ToneSource : public IAudioSource {
public:
    ToneSource(float bpm, float sampleRate, ISystemTime& time, bool paced = true);

    bool begin() override;
    void end() override {}
    int read(float* buffer, int maxSamples) override;
    float sampleRate() const override { return sampleRate_; }
    const char* describe() const override { return description_.c_str(); }

    // Tunables (0-1 mix levels)
    float kickLevel;
    float padLevel;
    float hatLevel;

private:
    float nextSample();

    float bpm_;
    float sampleRate_;
    ISystemTime& time_;
    bool paced_;
    std::string description_;

    uint64_t sampleIndex_;
    uint32_t noiseState_;
    uint32_t startMs_;
};
