#include "SpectralBands.h"
#include <arduinoFFT.h>
#include <math.h>

SpectralBands::SpectralBands()
    : windowSize_(0)
    , sampleRate_(0.0f)
    , binHz_(0.0f)
    , lowBins_{0, -1}
    , midBins_{0, -1}
    , highBins_{0, -1}
    , overallBins_{0, -1}
{
}

bool SpectralBands::begin(int windowSize, float sampleRate,
                          float minHz, float lowHz, float midHz, float maxHz) {
    if (!isPowerOfTwo(windowSize) ||
        windowSize < SpectralConstants::MIN_WINDOW_SIZE ||
        windowSize > SpectralConstants::MAX_WINDOW_SIZE) {
        return false;
    }
    if (!(sampleRate > 0.0f)) return false;
    if (!(minHz >= 0.0f && minHz < lowHz && lowHz < midHz && midHz < maxHz)) {
        return false;
    }

    windowSize_ = windowSize;
    sampleRate_ = sampleRate;
    binHz_ = sampleRate / windowSize;
    vReal_.assign(windowSize, 0.0f);
    vImag_.assign(windowSize, 0.0f);

    // Bands are half-open [lo, hi) in Hz, converted to inclusive bin ranges.
    // Bin 0 (DC) never contributes.
    float nyquist = sampleRate * 0.5f;
    float top = maxHz < nyquist ? maxHz : nyquist;
    const float edges[4] = {minHz, lowHz, midHz, top};
    int* ranges[3] = {lowBins_, midBins_, highBins_};

    for (int b = 0; b < 3; b++) {
        int lo = hzToBin(edges[b]);
        int hi = hzToBin(edges[b + 1]) - 1;
        if (lo < 1) lo = 1;
        // A narrow band still gets its nearest bin
        if (hi < lo && edges[b] < top) hi = lo;
        if (edges[b] >= top) hi = lo - 1;
        ranges[b][0] = lo;
        ranges[b][1] = hi;
    }

    overallBins_[0] = lowBins_[0];
    overallBins_[1] = highBins_[1] >= highBins_[0] ? highBins_[1] :
                      (midBins_[1] >= midBins_[0] ? midBins_[1] : lowBins_[1]);
    return true;
}

int SpectralBands::hzToBin(float hz) const {
    int bin = (int)ceilf(hz / binHz_);
    int maxBin = windowSize_ / 2;
    if (bin < 0) bin = 0;
    if (bin > maxBin) bin = maxBin;
    return bin;
}

void SpectralBands::analyze(const float* samples, BandEnergies& out) {
    out = BandEnergies();
    if (windowSize_ == 0 || !samples) {
        return;
    }

    for (int i = 0; i < windowSize_; i++) {
        vReal_[i] = samples[i];
        vImag_[i] = 0.0f;
    }

    computeFFT();

    out.low = bandMean(lowBins_);
    out.mid = bandMean(midBins_);
    out.high = bandMean(highBins_);
    out.overall = bandMean(overallBins_);
}

void SpectralBands::computeFFT() {
    // ArduinoFFT requires buffer references at construction time
    ArduinoFFT<float> fft(vReal_.data(), vImag_.data(), (uint_fast16_t)windowSize_, sampleRate_);
    fft.windowing(FFTWindow::Hann, FFTDirection::Forward);
    fft.compute(FFTDirection::Forward);
    fft.complexToMagnitude();

    const float scale = 2.0f / windowSize_;
    const int bins = windowSize_ / 2;
    for (int i = 0; i <= bins; i++) {
        float mag = vReal_[i] * scale;
        vReal_[i] = safeIsFinite(mag) ? mag : 0.0f;
    }
}

float SpectralBands::bandMean(const int bins[2]) const {
    int lo = bins[0];
    int hi = bins[1];
    if (hi < lo) return 0.0f;

    float sum = 0.0f;
    for (int i = lo; i <= hi; i++) {
        sum += vReal_[i];
    }
    float mean = sum / (float)(hi - lo + 1);
    return safeIsFinite(mean) ? mean : 0.0f;
}
