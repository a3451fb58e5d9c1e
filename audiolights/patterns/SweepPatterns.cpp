#include "SweepPatterns.h"
#include "ColorMath.h"
#include <math.h>

using namespace ColorMath;

void SwirlPattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    const int n = layout_->total();
    const float rate = params_->swirlRate;

    for (int i = 0; i < n; i++) {
        float u = (float)i / (float)n;
        float hue = frac(u + t * 0.1f) * 360.0f;

        LightFrame frame;
        frame.color = hsvToRgb(hue, 1.0f, 1.0f);
        frame.intensity = 0.6f + 0.4f * sinf(TWO_PI * (u - t * rate));
        frame.hasRotation = true;
        frame.yawDegrees = frac(t * rate) * 360.0f + u * 360.0f;
        out.set(i, frame);
    }
}

float WavePattern::wavePosition(const LightDescriptor& light) {
    static const Zone ORDER[NUM_ZONES] = {
        Zone::FRONT, Zone::LEFT, Zone::RIGHT, Zone::BACK, Zone::TOP, Zone::BOTTOM
    };

    int rank = 0;
    for (int r = 0; r < NUM_ZONES; r++) {
        if (ORDER[r] == light.zone) {
            rank = r;
            break;
        }
    }
    float zonePhase = (float)rank / NUM_ZONES;
    float within = light.zoneCount > 0 ? (float)light.zoneIndex / light.zoneCount : 0.0f;
    return frac(zonePhase * 0.5f + within * 0.5f);
}

void WavePattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    float phase = frac(t * params_->sweepRate);
    if (reverse_) {
        phase = frac(1.0f - phase);
    }

    const int n = layout_->total();
    for (int i = 0; i < n; i++) {
        float dist = fabsf(wavePosition(layout_->descriptor(i)) - phase);
        if (dist > 0.5f) dist = 1.0f - dist;

        float intensity = 1.0f - dist * 3.0f;
        out.set(i, WARM_BASE, intensity > 0.0f ? intensity : 0.0f);
    }
}
