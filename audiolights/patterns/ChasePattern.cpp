#include "ChasePattern.h"
#include "ColorMath.h"
#include <math.h>

ChasePattern::ChasePattern(bool reverse) : reverse_(reverse), head_(-1) {
}

void ChasePattern::reset() {
    head_ = -1;
}

int ChasePattern::headAt(float t, float stepSeconds, int n, bool reverse) {
    if (n <= 0) return -1;
    if (!(t >= 0.0f)) t = 0.0f;
    if (!(stepSeconds > 0.0f)) stepSeconds = 0.1f;

    long steps = (long)floorf(t / stepSeconds);
    int pos = (int)(steps % n);
    return reverse ? (n - 1) - pos : pos;
}

void ChasePattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    out.clear();

    const int n = layout_->total();
    if (n == 0) return;

    int tail = params_->chaseTail;
    if (tail < 1) tail = 1;
    if (tail > n) tail = n;

    head_ = headAt(t, params_->chaseStep, n, reverse_);

    for (int k = 0; k < tail; k++) {
        // Tail trails against the direction of travel
        int idx = reverse_ ? (head_ + k) % n : (head_ - k + n) % n;
        float intensity = 1.0f - (float)k / (float)tail;
        out.set(idx, ColorMath::WARM_BASE, intensity);
    }
}
