#pragma once
#include "Pattern.h"

/**
 * AudioPattern - Shared base for the audio-driven patterns
 *
 * Under the silence snapshot every audio pattern shows the same idle
 * look: warm base color at idleIntensity on every light.
 */
class AudioPattern : public Pattern {
public:
    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;

protected:
    // Only called with a non-silent snapshot
    virtual void stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) = 0;

    void fillIdle(LightFrameBuffer& out) const;

    // idle + (1 - idle) * e
    float aboveIdle(float energy) const;
};

/**
 * UpperBassPattern - Follows the low/mid blend in red to orange
 */
class UpperBassPattern : public AudioPattern {
public:
    void reset() override {}
    PatternType getType() const override { return PatternType::UPPER_BASS; }

protected:
    void stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
};

/**
 * BassFloodPattern - Blue-violet wash driven by the low band, flashes on beats
 */
class BassFloodPattern : public AudioPattern {
public:
    void reset() override { seenBeatCount_ = false; lastBeatCount_ = 0; }
    PatternType getType() const override { return PatternType::BASS_FLOOD; }

protected:
    void stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;

private:
    bool seenBeatCount_ = false;
    uint32_t lastBeatCount_ = 0;
};

/**
 * TrebleHuePattern - High band picks the hue, loudness picks the level
 */
class TrebleHuePattern : public AudioPattern {
public:
    void reset() override {}
    PatternType getType() const override { return PatternType::TREBLE_HUE; }

protected:
    void stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
};

/**
 * BandSplitPattern - Intensity from the low band, hue from the high band
 */
class BandSplitPattern : public AudioPattern {
public:
    void reset() override {}
    PatternType getType() const override { return PatternType::BAND_SPLIT; }

protected:
    void stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
};

/**
 * MusicColorPattern - All lights in one music-derived color
 *
 * Base hue follows loudness, the mid band shifts hue and brightness and
 * the low band adds a bass boost to intensity.
 */
class MusicColorPattern : public AudioPattern {
public:
    void reset() override {}
    PatternType getType() const override { return PatternType::MUSIC_COLOR; }

protected:
    void stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
};

/**
 * BeatHuePattern - Hue jumps by the golden angle on every beat pulse
 *
 * Pulses are counted through AudioSnapshot::beatCount, so a pulse that
 * arrived between two ticks still advances the hue.
 */
class BeatHuePattern : public AudioPattern {
public:
    void reset() override;
    PatternType getType() const override { return PatternType::BEAT_HUE; }

    float currentHue() const { return hue_; }

protected:
    void stepAudio(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;

private:
    float hue_ = 0.0f;
    bool seenBeatCount_ = false;
    uint32_t lastBeatCount_ = 0;
};
