#pragma once
#include "Pattern.h"

/**
 * SwirlPattern - Rainbow that rotates around the light ring
 *
 * Hue and brightness travel along the global order, and every light gets
 * a yaw so the lights themselves spin with the swirl.
 */
class SwirlPattern : public Pattern {
public:
    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override {}
    PatternType getType() const override { return PatternType::SWIRL; }
};

/**
 * WavePattern - A soft band of light sweeps front to back (or back to front)
 *
 * Zones are ranked front, left, right, back, top, bottom. A light's wave
 * position mixes its zone rank and its place in the zone; intensity falls
 * off linearly with circular distance to the moving phase, reaching zero
 * one third of a cycle away.
 */
class WavePattern : public Pattern {
public:
    explicit WavePattern(bool reverse) : reverse_(reverse) {}

    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override {}
    PatternType getType() const override {
        return reverse_ ? PatternType::BACK_TO_FRONT : PatternType::FRONT_TO_BACK;
    }

    // Position of a light on the wave, in [0, 1)
    static float wavePosition(const LightDescriptor& light);

private:
    bool reverse_;
};
