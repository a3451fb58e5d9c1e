#include "AudioPatterns.h"
#include "ColorMath.h"

using namespace ColorMath;

void AudioPattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    if (audio.isSilent()) {
        fillIdle(out);
        return;
    }
    stepAudio(audio, t, out);
}

void AudioPattern::fillIdle(LightFrameBuffer& out) const {
    out.fill(WARM_BASE, params_->idleIntensity);
}

float AudioPattern::aboveIdle(float energy) const {
    float idle = params_->idleIntensity;
    return idle + (1.0f - idle) * clamp01(energy);
}

void UpperBassPattern::stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)t;
    float energy = (audio.low + audio.mid) * 0.5f;
    out.fill(hsvToRgb(40.0f * clamp01(audio.mid), 1.0f, 1.0f), aboveIdle(energy));
}

void BassFloodPattern::stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)t;
    bool flash = false;
    if (seenBeatCount_ && audio.beatCount != lastBeatCount_) {
        flash = true;
    }
    seenBeatCount_ = true;
    lastBeatCount_ = audio.beatCount;

    float low = clamp01(audio.low);
    float intensity = flash ? 1.0f : aboveIdle(low);
    out.fill(hsvToRgb(240.0f + 60.0f * low, 1.0f, 1.0f), intensity);
}

void TrebleHuePattern::stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)t;
    const int n = layout_->total();
    float baseHue = energyToHue(audio.high);
    float intensity = aboveIdle(audio.overall);

    for (int i = 0; i < n; i++) {
        float hue = baseHue + 30.0f * (float)i / (float)n;
        out.set(i, hsvToRgb(hue, 1.0f, 1.0f), intensity);
    }
}

void BandSplitPattern::stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)t;
    float hue = wrapHue(clamp01(audio.high) * 360.0f);
    out.fill(hsvToRgb(hue, 1.0f, 1.0f), clamp01(audio.low));
}

void MusicColorPattern::stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)t;
    float baseTurns = clamp01(audio.overall) * 0.5f;
    float mid = clamp01(audio.mid);
    float hueTurns = frac(baseTurns + mid * 0.3f);
    RGBf color = hsvToRgb(hueTurns * 360.0f, 0.9f, 0.3f + 0.7f * mid);

    float intensity = 0.5f + 0.5f * clamp01(audio.overall);
    intensity *= 0.7f + 0.3f * clamp01(audio.low);
    out.fill(color, intensity);
}

void BeatHuePattern::reset() {
    hue_ = 0.0f;
    seenBeatCount_ = false;
    lastBeatCount_ = 0;
}

void BeatHuePattern::stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)t;
    if (seenBeatCount_) {
        // Unsigned difference handles counter wrap
        uint32_t pulses = audio.beatCount - lastBeatCount_;
        if (pulses > 0) {
            hue_ = wrapHue(hue_ + GOLDEN_ANGLE * (float)pulses);
        }
    }
    seenBeatCount_ = true;
    lastBeatCount_ = audio.beatCount;

    out.fill(hsvToRgb(hue_, 1.0f, 1.0f), clamp01(audio.low));
}
