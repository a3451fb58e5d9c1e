#pragma once
#include "Pattern.h"

/**
 * ChasePattern - A lit head with a fading tail runs through every light
 *
 * Follows the global light order. The head moves one light per chaseStep
 * seconds and wraps modulo the light count; the tail trails behind it
 * (or ahead of it, for the reverse variant, so the tail is always behind
 * the direction of travel).
 *
 * Intensity of the k-th light from the head is 1 - k/T for a tail of T.
 */
class ChasePattern : public Pattern {
public:
    explicit ChasePattern(bool reverse);

    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override;
    PatternType getType() const override {
        return reverse_ ? PatternType::CHASE_REVERSE : PatternType::CHASE;
    }

    // Head index from the most recent step (-1 before the first step)
    int headIndex() const { return head_; }

    // Head position at time t for n lights
    static int headAt(float t, float stepSeconds, int n, bool reverse);

private:
    bool reverse_;
    int head_;
};
