#include "ToneSource.h"
#include <math.h>
#include <stdio.h>

namespace {
    constexpr float TWO_PI = 6.28318530718f;
    constexpr float KICK_HZ = 55.0f;
    constexpr float KICK_DECAY = 18.0f;   // 1/s
    constexpr float HAT_DECAY = 60.0f;    // 1/s
}

ToneSource::ToneSource(float bpm, float sampleRate, ISystemTime& time, bool paced)
    : kickLevel(0.8f)
    , padLevel(0.15f)
    , hatLevel(0.2f)
    , bpm_(bpm > 0.0f ? bpm : 120.0f)
    , sampleRate_(sampleRate)
    , time_(time)
    , paced_(paced)
    , sampleIndex_(0)
    , noiseState_(0x12345678u)
    , startMs_(0)
{
    char buf[48];
    snprintf(buf, sizeof(buf), "tone:%.0fbpm", bpm_);
    description_ = buf;
}

bool ToneSource::begin() {
    if (!(sampleRate_ > 0.0f)) return false;
    sampleIndex_ = 0;
    noiseState_ = 0x12345678u;
    startMs_ = time_.millis();
    return true;
}

float ToneSource::nextSample() {
    float t = sampleIndex_ / sampleRate_;
    float beatLen = 60.0f / bpm_;
    float sinceBeat = fmodf(t, beatLen);
    float sinceOffbeat = fmodf(t + beatLen * 0.5f, beatLen);

    float kick = sinf(TWO_PI * KICK_HZ * sinceBeat) * expf(-KICK_DECAY * sinceBeat);

    // A minor triad, slowly breathing
    float pad = (sinf(TWO_PI * 440.0f * t) + sinf(TWO_PI * 523.25f * t) + sinf(TWO_PI * 659.25f * t)) / 3.0f;
    pad *= 0.6f + 0.4f * sinf(TWO_PI * 0.25f * t);

    // xorshift noise for the hat
    noiseState_ ^= noiseState_ << 13;
    noiseState_ ^= noiseState_ >> 17;
    noiseState_ ^= noiseState_ << 5;
    float noise = (noiseState_ / 4294967295.0f) * 2.0f - 1.0f;
    float hat = noise * expf(-HAT_DECAY * sinceOffbeat);

    sampleIndex_++;
    return kickLevel * kick + padLevel * pad + hatLevel * hat;
}

int ToneSource::read(float* buffer, int maxSamples) {
    if (!buffer || maxSamples <= 0) return -1;

    int wanted = maxSamples;
    if (paced_) {
        uint64_t elapsedMs = time_.millis() - startMs_;
        uint64_t due = (uint64_t)(elapsedMs * (double)sampleRate_ / 1000.0);
        if (due <= sampleIndex_) return 0;
        if (due - sampleIndex_ < (uint64_t)wanted) wanted = (int)(due - sampleIndex_);
    }

    for (int i = 0; i < wanted; i++) {
        buffer[i] = nextSample();
    }
    return wanted;
}
