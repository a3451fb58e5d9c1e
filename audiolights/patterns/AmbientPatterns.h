#pragma once
#include "Pattern.h"

/**
 * BreathingPattern - Every light slowly fades between dim and full
 */
class BreathingPattern : public Pattern {
public:
    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override {}
    PatternType getType() const override { return PatternType::BREATHING; }

    // 0.1 at the bottom of a breath, 1.0 at the top
    static float levelAt(float t, float period);
};

/**
 * AllOnPattern - Every light at full intensity
 */
class AllOnPattern : public Pattern {
public:
    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override {}
    PatternType getType() const override { return PatternType::ALL_ON; }
};
