#include "BeatDetector.h"

#include <stddef.h>

namespace {
    constexpr int MAX_HISTORY_FRAMES = 256;
}

BeatDetector::BeatDetector()
    : thresholdRatio(1.5f)
    , minEnergy(0.15f)
    , refractoryMs(250)
    , historyIndex_(0)
    , historyFilled_(0)
    , armed_(true)
    , hasBeat_(false)
    , lastBeatMs_(0)
    , beatCount_(0)
{
    history_.assign(43, 0.0f);
}

void BeatDetector::configure(float ratio, int historyFrames, float minE, uint32_t refractory) {
    thresholdRatio = ratio;
    minEnergy = minE;
    refractoryMs = refractory;
    if (historyFrames < 1) historyFrames = 1;
    if (historyFrames > MAX_HISTORY_FRAMES) historyFrames = MAX_HISTORY_FRAMES;
    history_.assign(historyFrames, 0.0f);
    reset();
}

void BeatDetector::reset() {
    for (size_t i = 0; i < history_.size(); i++) {
        history_[i] = 0.0f;
    }
    historyIndex_ = 0;
    historyFilled_ = 0;
    armed_ = true;
    hasBeat_ = false;
    lastBeatMs_ = 0;
}

float BeatDetector::rollingAverage() const {
    if (historyFilled_ == 0) return 0.0f;
    float sum = 0.0f;
    for (int i = 0; i < historyFilled_; i++) {
        sum += history_[i];
    }
    return sum / historyFilled_;
}

bool BeatDetector::update(float energy, uint32_t timeMs) {
    if (!(energy == energy)) energy = 0.0f;

    float threshold = rollingAverage() * thresholdRatio;
    bool above = energy > threshold && energy >= minEnergy;

    // Re-arm once the energy falls back under the threshold
    if (!above) {
        armed_ = true;
    }

    bool inRefractory = hasBeat_ && (timeMs - lastBeatMs_) < refractoryMs;
    bool fired = false;
    if (above && armed_ && !inRefractory) {
        fired = true;
        armed_ = false;
        hasBeat_ = true;
        lastBeatMs_ = timeMs;
        beatCount_++;
    }

    // Current value joins the history after the comparison
    history_[historyIndex_] = energy;
    historyIndex_ = (historyIndex_ + 1) % (int)history_.size();
    if (historyFilled_ < (int)history_.size()) historyFilled_++;

    return fired;
}
