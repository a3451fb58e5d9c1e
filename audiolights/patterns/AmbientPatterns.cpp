#include "AmbientPatterns.h"
#include "ColorMath.h"
#include <math.h>

float BreathingPattern::levelAt(float t, float period) {
    if (!(period > 0.0f)) period = 4.0f;
    float phase = ColorMath::frac(t / period);
    return 0.1f + 0.9f * (0.5f - 0.5f * cosf(ColorMath::TWO_PI * phase));
}

void BreathingPattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    out.fill(ColorMath::WARM_BASE, levelAt(t, params_->breathPeriod));
}

void AllOnPattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    (void)t;
    out.fill(ColorMath::WARM_BASE, 1.0f);
}
