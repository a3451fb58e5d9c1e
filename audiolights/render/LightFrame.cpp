#include "LightFrame.h"
#include "../types/LightsAssert.h"
#include <math.h>
#include <new>

namespace {
    float clampChannel(float v) {
        if (!(v == v)) return 0.0f;  // NaN
        return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v);
    }

    float wrapYaw(float deg) {
        if (!(deg == deg) || deg > 3.4e38f || deg < -3.4e38f) return 0.0f;
        float w = fmodf(deg, 360.0f);
        if (w < 0.0f) w += 360.0f;
        if (w >= 360.0f) w = 0.0f;
        return w;
    }

    // Shared fallback for out-of-range reads
    LightFrame dummyFrame;
}

void LightFrame::clamp() {
    color.r = clampChannel(color.r);
    color.g = clampChannel(color.g);
    color.b = clampChannel(color.b);
    intensity = clampChannel(intensity);
    yawDegrees = hasRotation ? wrapYaw(yawDegrees) : 0.0f;
}

bool LightFrame::approxEquals(const LightFrame& other, float epsilon) const {
    if (hasRotation != other.hasRotation) return false;
    if (fabsf(color.r - other.color.r) > epsilon) return false;
    if (fabsf(color.g - other.color.g) > epsilon) return false;
    if (fabsf(color.b - other.color.b) > epsilon) return false;
    if (fabsf(intensity - other.intensity) > epsilon) return false;
    if (hasRotation) {
        // Compare on the circle so 359.9 and 0.0 count as equal
        float d = fabsf(yawDegrees - other.yawDegrees);
        if (d > 180.0f) d = 360.0f - d;
        if (d > epsilon * 360.0f) return false;
    }
    return true;
}

LightFrameBuffer::LightFrameBuffer(int count) : frames_(nullptr), count_(0) {
    resize(count);
}

LightFrameBuffer::~LightFrameBuffer() {
    delete[] frames_;
}

LightFrameBuffer::LightFrameBuffer(const LightFrameBuffer& other) : frames_(nullptr), count_(0) {
    resize(other.count_);
    for (int i = 0; i < count_; i++) {
        frames_[i] = other.frames_[i];
    }
}

LightFrameBuffer& LightFrameBuffer::operator=(const LightFrameBuffer& other) {
    if (this != &other) {
        resize(other.count_);
        for (int i = 0; i < count_; i++) {
            frames_[i] = other.frames_[i];
        }
    }
    return *this;
}

void LightFrameBuffer::resize(int count) {
    if (count < 0) count = 0;
    if (count == count_ && (frames_ || count == 0)) {
        clear();
        return;
    }
    delete[] frames_;
    frames_ = nullptr;
    count_ = 0;
    if (count > 0) {
        frames_ = new(std::nothrow) LightFrame[count];
        if (frames_) {
            count_ = count;
        }
    }
}

LightFrame& LightFrameBuffer::get(int index) {
    LIGHTS_ASSERT(isValidIndex(index), "OOB light index in LightFrameBuffer::get");
    if (!isValidIndex(index)) {
        dummyFrame = LightFrame();
        return dummyFrame;
    }
    return frames_[index];
}

const LightFrame& LightFrameBuffer::get(int index) const {
    LIGHTS_ASSERT(isValidIndex(index), "OOB light index in LightFrameBuffer::get");
    if (!isValidIndex(index)) {
        dummyFrame = LightFrame();
        return dummyFrame;
    }
    return frames_[index];
}

void LightFrameBuffer::set(int index, const LightFrame& frame) {
    if (isValidIndex(index)) {
        frames_[index] = frame;
    }
}

void LightFrameBuffer::set(int index, const RGBf& color, float intensity) {
    if (isValidIndex(index)) {
        frames_[index] = LightFrame(color, intensity);
    }
}

void LightFrameBuffer::clear() {
    for (int i = 0; i < count_; i++) {
        frames_[i] = LightFrame();
    }
}

void LightFrameBuffer::fill(const RGBf& color, float intensity) {
    for (int i = 0; i < count_; i++) {
        frames_[i] = LightFrame(color, intensity);
    }
}
