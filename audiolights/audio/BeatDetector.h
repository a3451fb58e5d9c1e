#pragma once

#include <stdint.h>
#include <vector>

/**
 * BeatDetector - Low-band energy onset detector
 *
 * Fires when the current energy exceeds the rolling average of recent
 * frames by a multiplicative threshold. After firing it stays quiet for the
 * refractory interval and until the energy has dropped back under the
 * threshold, so a sustained loud note produces a single pulse.
 *
 * Time is supplied by the caller (the analyzer's sample clock), which keeps
 * detection deterministic for a given input stream.
 */
class BeatDetector {
public:
    BeatDetector();

    void configure(float thresholdRatio, int historyFrames, float minEnergy,
                   uint32_t refractoryMs);

    /**
     * Feed one frame of normalized low-band energy.
     * @return true when a beat pulse fires on this frame
     */
    bool update(float energy, uint32_t timeMs);

    // Clears history; beatCount() keeps counting
    void reset();

    uint32_t beatCount() const { return beatCount_; }
    float rollingAverage() const;

    // Tunables
    float thresholdRatio;      // Energy must exceed average * this (default 1.5)
    float minEnergy;           // Ignore pulses quieter than this (default 0.15)
    uint32_t refractoryMs;     // Minimum spacing between pulses (default 250)

private:
    std::vector<float> history_;
    int historyIndex_;
    int historyFilled_;
    bool armed_;
    bool hasBeat_;
    uint32_t lastBeatMs_;
    uint32_t beatCount_;
};
