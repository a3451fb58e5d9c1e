#pragma once

#include <stdint.h>
#include <vector>

namespace SpectralConstants {
    constexpr int MIN_WINDOW_SIZE = 64;
    constexpr int MAX_WINDOW_SIZE = 8192;

    // Default band edges (Hz)
    constexpr float DEFAULT_MIN_HZ = 20.0f;
    constexpr float DEFAULT_LOW_HZ = 250.0f;     // low/mid boundary
    constexpr float DEFAULT_MID_HZ = 2000.0f;    // mid/high boundary
    constexpr float DEFAULT_MAX_HZ = 20000.0f;   // clipped to Nyquist
}

/**
 * BandEnergies - Raw (unnormalized) mean magnitude per band for one window
 */
struct BandEnergies {
    float low = 0.0f;
    float mid = 0.0f;
    float high = 0.0f;
    float overall = 0.0f;
};

/**
 * SpectralBands - Windowed FFT reduced to three bands plus overall
 *
 * Applies a Hann window, runs the FFT, converts to magnitudes and takes
 * the mean magnitude over each band's bins. Magnitudes are scaled by 2/N
 * so a full-scale sine lands near 0.5 in its bin regardless of window size.
 *
 * Memory: 2 * windowSize floats for the FFT buffers.
 */
class SpectralBands {
public:
    SpectralBands();

    /**
     * Allocate buffers and compute bin ranges.
     * @return false when windowSize is not a power of two in range or the
     *         band edges are not strictly increasing
     */
    bool begin(int windowSize, float sampleRate,
               float minHz, float lowHz, float midHz, float maxHz);

    // Analyze exactly windowSize() samples
    void analyze(const float* samples, BandEnergies& out);

    int windowSize() const { return windowSize_; }
    float binFrequency() const { return binHz_; }

    // Inclusive bin ranges, exposed for tests; hi < lo means empty band
    int lowStartBin() const { return lowBins_[0]; }
    int lowEndBin() const { return lowBins_[1]; }
    int highStartBin() const { return highBins_[0]; }
    int highEndBin() const { return highBins_[1]; }

    static bool isPowerOfTwo(int n) { return n > 0 && (n & (n - 1)) == 0; }

private:
    void computeFFT();
    float bandMean(const int bins[2]) const;
    int hzToBin(float hz) const;

    // Portable isfinite check
    static bool safeIsFinite(float x) {
        return (x == x) && (x >= -3.4e38f) && (x <= 3.4e38f);
    }

    int windowSize_;
    float sampleRate_;
    float binHz_;
    std::vector<float> vReal_;
    std::vector<float> vImag_;

    int lowBins_[2];
    int midBins_[2];
    int highBins_[2];
    int overallBins_[2];
};
