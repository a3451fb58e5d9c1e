#pragma once

#include "AudioSnapshot.h"
#include "SpectralBands.h"
#include "BeatDetector.h"
#include "../hal/interfaces/ISystemTime.h"
#include <stdint.h>
#include <vector>

/**
 * AnalyzerParams - Tunables for the audio analysis pipeline
 */
struct AnalyzerParams {
    float sampleRate;          // Hz, normally taken from the source
    int windowSize;            // FFT length, power of two
    int hopSize;               // New samples between successive windows

    // Band edges (Hz)
    float minHz;
    float lowHz;               // low/mid boundary
    float midHz;               // mid/high boundary
    float maxHz;

    // Normalization
    float normDecayTau;        // Running max decay time constant (s)
    float normFloor;           // Running max never drops below this

    // Smoothing
    float attackTau;           // Rising edge time constant (s)
    float releaseTau;          // Falling edge time constant (s)

    // Beat detection
    float beatThreshold;       // Ratio over rolling average
    float beatWindow;          // Rolling average length (s)
    float beatMinEnergy;       // Minimum normalized low energy for a pulse
    uint32_t beatRefractoryMs;

    // Publish silence after this long without input
    uint32_t silenceTimeoutMs;

    AnalyzerParams() {
        sampleRate = 44100.0f;
        windowSize = 2048;
        hopSize = 512;
        minHz = SpectralConstants::DEFAULT_MIN_HZ;
        lowHz = SpectralConstants::DEFAULT_LOW_HZ;
        midHz = SpectralConstants::DEFAULT_MID_HZ;
        maxHz = SpectralConstants::DEFAULT_MAX_HZ;
        normDecayTau = 8.0f;
        normFloor = 1e-4f;
        attackTau = 0.03f;
        releaseTau = 0.30f;
        beatThreshold = 1.5f;
        beatWindow = 0.5f;
        beatMinEnergy = 0.15f;
        beatRefractoryMs = 250;
        silenceTimeoutMs = 500;
    }
};

/**
 * AudioAnalyzer - Turns a mono sample stream into AudioSnapshots
 *
 * Pipeline per analysis frame (every hopSize samples once the first
 * window has filled):
 *   Hann window + FFT -> band means -> running-max normalization ->
 *   beat detection on the normalized low band -> attack/release smoothing
 *
 * Not thread-safe: owned and driven by a single audio thread.
 *
 * Usage:
 *   AudioAnalyzer analyzer(clock);
 *   analyzer.begin(params);
 *   if (analyzer.addSamples(block, n) > 0) cell.publish(analyzer.latest());
 *   if (analyzer.checkTimeout()) cell.publish(analyzer.latest());
 */
class AudioAnalyzer {
public:
    explicit AudioAnalyzer(ISystemTime& time);

    bool begin(const AnalyzerParams& params);

    // Clear buffers, normalizers and smoothing; beat count is preserved
    void reset();

    /**
     * Append samples. Blocks containing non-finite values, a null pointer
     * or a non-positive count are dropped whole.
     * @return analysis frames produced (0 if the block was dropped or the
     *         window is still filling)
     */
    int addSamples(const float* samples, int count);

    /**
     * Publish-worthy silence check. Returns true exactly once per gap when
     * no samples arrived for longer than silenceTimeoutMs; latest() is then
     * the silence snapshot.
     */
    bool checkTimeout();

    const AudioSnapshot& latest() const { return latest_; }
    const AnalyzerParams& params() const { return params_; }

    uint32_t framesAnalyzed() const { return framesAnalyzed_; }
    uint32_t droppedBlocks() const { return droppedBlocks_; }

    // Seconds of audio per analysis frame
    float framePeriod() const;

private:
    void analyzeFrame();
    float normalize(int band, float raw, float dt);
    float smooth(float current, float target, float dt) const;

    // Portable isfinite check
    static bool safeIsFinite(float x) {
        return (x == x) && (x >= -3.4e38f) && (x <= 3.4e38f);
    }

    static float clamp01(float x) {
        return x < 0.0f ? 0.0f : (x > 1.0f ? 1.0f : x);
    }

    enum { BAND_LOW = 0, BAND_MID, BAND_HIGH, BAND_OVERALL, NUM_BANDS };

    ISystemTime& time_;
    AnalyzerParams params_;
    SpectralBands bands_;
    BeatDetector beat_;

    std::vector<float> buffer_;     // Pending samples, oldest first
    float runningMax_[NUM_BANDS];
    float smoothed_[NUM_BANDS];

    AudioSnapshot latest_;
    uint64_t samplesConsumed_;      // Sample clock for beat timing
    uint32_t lastInputMs_;
    uint32_t framesAnalyzed_;
    uint32_t droppedBlocks_;
    bool timedOut_;
    bool initialized_;

    // Prevent copying
    AudioAnalyzer(const AudioAnalyzer&) = delete;
    AudioAnalyzer& operator=(const AudioAnalyzer&) = delete;
};
