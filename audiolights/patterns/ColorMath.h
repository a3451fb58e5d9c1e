#pragma once
#include "../render/LightFrame.h"

/**
 * ColorMath - Hue/energy helpers shared by the patterns
 *
 * Hues are in degrees. Every function returns finite values for any
 * input, including NaN and infinities.
 */
namespace ColorMath {

// Warm amber used by the time-driven patterns and the idle look
const RGBf WARM_BASE(1.0f, 0.5f, 0.2f);

constexpr float GOLDEN_ANGLE = 137.50776f;
constexpr float TWO_PI = 6.28318530718f;

float clamp01(float x);

// Fractional part in [0, 1), also for negative input
float frac(float x);

// Wrap any hue into [0, 360); non-finite hues map to 0
float wrapHue(float degrees);

// HSV to RGB, s and v clamped to [0, 1]
RGBf hsvToRgb(float hueDegrees, float saturation, float value);

// Linear energy-to-hue sweep: 0 -> 0 deg (red), 1 -> 300 deg (magenta)
float energyToHue(float energy);

}
