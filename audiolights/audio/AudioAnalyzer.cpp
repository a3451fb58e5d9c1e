#include "AudioAnalyzer.h"
#include "../config/DebugLog.h"
#include <math.h>

AudioAnalyzer::AudioAnalyzer(ISystemTime& time)
    : time_(time)
    , runningMax_{}
    , smoothed_{}
    , samplesConsumed_(0)
    , lastInputMs_(0)
    , framesAnalyzed_(0)
    , droppedBlocks_(0)
    , timedOut_(false)
    , initialized_(false)
{
}

bool AudioAnalyzer::begin(const AnalyzerParams& params) {
    params_ = params;
    initialized_ = false;

    if (params_.hopSize < 1 || params_.hopSize > params_.windowSize) {
        DEBUG_ERROR_F("Analyzer hop size %d must be in 1..%d\n", params_.hopSize, params_.windowSize);
        return false;
    }
    if (!bands_.begin(params_.windowSize, params_.sampleRate,
                      params_.minHz, params_.lowHz, params_.midHz, params_.maxHz)) {
        DEBUG_ERROR_F("Analyzer rejected window %d / bands %.0f-%.0f-%.0f-%.0f Hz\n",
                      params_.windowSize, params_.minHz, params_.lowHz, params_.midHz, params_.maxHz);
        return false;
    }

    int historyFrames = (int)(params_.beatWindow / framePeriod() + 0.5f);
    beat_.configure(params_.beatThreshold, historyFrames, params_.beatMinEnergy,
                    params_.beatRefractoryMs);

    buffer_.reserve(params_.windowSize + params_.hopSize * 4);
    reset();
    initialized_ = true;

    DEBUG_INFO_F("Analyzer: %.0f Hz, window %d, hop %d (%.1f ms/frame)\n",
                 params_.sampleRate, params_.windowSize, params_.hopSize, framePeriod() * 1000.0f);
    return true;
}

void AudioAnalyzer::reset() {
    buffer_.clear();
    for (int i = 0; i < NUM_BANDS; i++) {
        runningMax_[i] = 0.0f;
        smoothed_[i] = 0.0f;
    }
    uint32_t count = beat_.beatCount();
    beat_.reset();
    latest_ = AudioSnapshot::silence(time_.millis(), count);
    lastInputMs_ = time_.millis();
    timedOut_ = false;
}

float AudioAnalyzer::framePeriod() const {
    return params_.sampleRate > 0.0f ? (float)params_.hopSize / params_.sampleRate : 0.0f;
}

int AudioAnalyzer::addSamples(const float* samples, int count) {
    if (!initialized_) return 0;

    if (!samples || count <= 0) {
        droppedBlocks_++;
        DEBUG_WARN_F("Dropped malformed audio block (%d samples)\n", count);
        return 0;
    }
    for (int i = 0; i < count; i++) {
        if (!safeIsFinite(samples[i])) {
            droppedBlocks_++;
            DEBUG_WARN_F("Dropped audio block with non-finite sample at %d\n", i);
            return 0;
        }
    }

    lastInputMs_ = time_.millis();
    timedOut_ = false;

    int frames = 0;
    for (int i = 0; i < count; i++) {
        buffer_.push_back(samples[i]);
        samplesConsumed_++;

        if ((int)buffer_.size() >= params_.windowSize) {
            analyzeFrame();
            frames++;
            // Slide by one hop; the overlap stays for the next window
            buffer_.erase(buffer_.begin(), buffer_.begin() + params_.hopSize);
        }
    }
    return frames;
}

bool AudioAnalyzer::checkTimeout() {
    if (!initialized_ || timedOut_) return false;

    uint32_t now = time_.millis();
    if (now - lastInputMs_ <= params_.silenceTimeoutMs) {
        return false;
    }

    DEBUG_VERBOSE_F("No audio for %u ms, publishing silence\n", now - lastInputMs_);
    reset();
    timedOut_ = true;
    return true;
}

void AudioAnalyzer::analyzeFrame() {
    BandEnergies raw;
    bands_.analyze(buffer_.data(), raw);

    const float dt = framePeriod();
    float norm[NUM_BANDS];
    norm[BAND_LOW] = normalize(BAND_LOW, raw.low, dt);
    norm[BAND_MID] = normalize(BAND_MID, raw.mid, dt);
    norm[BAND_HIGH] = normalize(BAND_HIGH, raw.high, dt);
    norm[BAND_OVERALL] = normalize(BAND_OVERALL, raw.overall, dt);

    uint32_t sampleClockMs = (uint32_t)((samplesConsumed_ * 1000ULL) / (uint64_t)params_.sampleRate);
    bool beat = beat_.update(norm[BAND_LOW], sampleClockMs);

    for (int i = 0; i < NUM_BANDS; i++) {
        smoothed_[i] = clamp01(smooth(smoothed_[i], norm[i], dt));
    }

    latest_.low = smoothed_[BAND_LOW];
    latest_.mid = smoothed_[BAND_MID];
    latest_.high = smoothed_[BAND_HIGH];
    latest_.overall = smoothed_[BAND_OVERALL];
    latest_.beat = beat;
    latest_.beatCount = beat_.beatCount();
    latest_.timestampMs = time_.millis();

    framesAnalyzed_++;
}

float AudioAnalyzer::normalize(int band, float raw, float dt) {
    if (!safeIsFinite(raw) || raw < 0.0f) raw = 0.0f;

    // Decaying running max tracks the loudest recent level per band
    float decay = params_.normDecayTau > 0.0f ? expf(-dt / params_.normDecayTau) : 0.0f;
    float decayedMax = runningMax_[band] * decay;
    runningMax_[band] = raw > decayedMax ? raw : decayedMax;

    float maxVal = runningMax_[band] > params_.normFloor ? runningMax_[band] : params_.normFloor;
    float value = raw / maxVal;
    return safeIsFinite(value) ? clamp01(value) : 0.0f;
}

float AudioAnalyzer::smooth(float current, float target, float dt) const {
    float tau = target > current ? params_.attackTau : params_.releaseTau;
    if (tau <= 0.0f) return target;
    float alpha = 1.0f - expf(-dt / tau);
    return current + alpha * (target - current);
}
