#pragma once
#include <stdint.h>

/**
 * RGBf - Linear color, each channel in [0, 1]
 */
struct RGBf {
    float r, g, b;

    RGBf() : r(0.0f), g(0.0f), b(0.0f) {}
    RGBf(float red, float green, float blue) : r(red), g(green), b(blue) {}

    bool operator==(const RGBf& other) const {
        return r == other.r && g == other.g && b == other.b;
    }

    bool operator!=(const RGBf& other) const {
        return !(*this == other);
    }
};

/**
 * LightFrame - What one light should look like this tick
 *
 * Values leave the pattern engine unclamped; the scheduler clamps them
 * before anything reaches the transport.
 */
struct LightFrame {
    RGBf color;
    float intensity = 0.0f;
    bool hasRotation = false;    // Pattern drives this light's yaw
    float yawDegrees = 0.0f;     // Wrapped to [0, 360) by clamp()

    LightFrame() {}
    LightFrame(const RGBf& c, float i) : color(c), intensity(i) {}

    // Clamp channels to [0,1], wrap yaw, replace non-finite values with 0
    void clamp();

    // True when every channel differs by at most epsilon
    bool approxEquals(const LightFrame& other, float epsilon) const;
};

/**
 * LightFrameBuffer - One LightFrame per light, in global layout order
 *
 * This is the intermediate format between the pattern engine and the
 * scheduler's diff/send stage.
 */
class LightFrameBuffer {
private:
    LightFrame* frames_;
    int count_;

public:
    explicit LightFrameBuffer(int count = 0);
    ~LightFrameBuffer();

    LightFrameBuffer(const LightFrameBuffer& other);
    LightFrameBuffer& operator=(const LightFrameBuffer& other);

    // Reallocates only when the size changes
    void resize(int count);

    int size() const { return count_; }
    bool isValidIndex(int index) const { return index >= 0 && index < count_; }

    LightFrame& get(int index);
    const LightFrame& get(int index) const;
    void set(int index, const LightFrame& frame);
    void set(int index, const RGBf& color, float intensity);

    void clear();
    void fill(const RGBf& color, float intensity);
};
