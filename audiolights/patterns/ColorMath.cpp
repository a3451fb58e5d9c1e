#include "ColorMath.h"
#include <math.h>

namespace ColorMath {

namespace {
    bool isFinite(float x) {
        return (x == x) && (x >= -3.4e38f) && (x <= 3.4e38f);
    }
}

float clamp01(float x) {
    if (!(x == x)) return 0.0f;
    return x < 0.0f ? 0.0f : (x > 1.0f ? 1.0f : x);
}

float frac(float x) {
    if (!isFinite(x)) return 0.0f;
    float f = x - floorf(x);
    return f >= 1.0f ? 0.0f : f;
}

float wrapHue(float degrees) {
    if (!isFinite(degrees)) return 0.0f;
    float h = fmodf(degrees, 360.0f);
    if (h < 0.0f) h += 360.0f;
    return h >= 360.0f ? 0.0f : h;
}

RGBf hsvToRgb(float hueDegrees, float saturation, float value) {
    float h = wrapHue(hueDegrees) / 60.0f;
    float s = clamp01(saturation);
    float v = clamp01(value);

    int i = (int)floorf(h);
    float f = h - i;
    float p = v * (1.0f - s);
    float q = v * (1.0f - s * f);
    float t = v * (1.0f - s * (1.0f - f));

    switch (i % 6) {
        case 0: return RGBf(v, t, p);
        case 1: return RGBf(q, v, p);
        case 2: return RGBf(p, v, t);
        case 3: return RGBf(p, q, v);
        case 4: return RGBf(t, p, v);
        default: return RGBf(v, p, q);
    }
}

float energyToHue(float energy) {
    return clamp01(energy) * 300.0f;
}

}
