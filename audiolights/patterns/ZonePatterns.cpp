#include "ZonePatterns.h"
#include "ColorMath.h"
#include "ChasePattern.h"
#include "AmbientPatterns.h"
#include <math.h>
#include <stdlib.h>

using namespace ColorMath;

void ZoneOffPattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    (void)t;
    const int n = layout_->total();
    for (int i = 0; i < n; i++) {
        float intensity = layout_->descriptor(i).zone == darkZone_ ? 0.0f : 1.0f;
        out.set(i, WARM_BASE, intensity);
    }
}

void LeftRightAltPattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    float period = params_->altPeriod > 0.0f ? params_->altPeriod : 1.0f;
    long k = (long)floorf((t > 0.0f ? t : 0.0f) / period);
    leftLit_ = (k % 2) == 0;

    const int n = layout_->total();
    for (int i = 0; i < n; i++) {
        Zone zone = layout_->descriptor(i).zone;
        float intensity = 0.5f;
        if (zone == Zone::LEFT) {
            intensity = leftLit_ ? 1.0f : 0.0f;
        } else if (zone == Zone::RIGHT) {
            intensity = leftLit_ ? 0.0f : 1.0f;
        }
        out.set(i, WARM_BASE, intensity);
    }
}

int CenterOutPattern::centerRank(int zoneIndex, int zoneCount) {
    if (zoneCount <= 0) return 0;
    // |2i - (n-1)| is twice the distance from the midpoint
    return abs(2 * zoneIndex - (zoneCount - 1)) / 2;
}

int CenterOutPattern::litLevels(float t, float period, int levels) {
    if (!(period > 0.0f)) period = 2.0f;
    // levels+1 steps: the first step of each period is fully dark
    int lit = (int)floorf(frac(t / period) * (levels + 1));
    return lit > levels ? levels : lit;
}

bool CenterOutPattern::begin(const LightLayout& layout, const PatternParams& params) {
    Pattern::begin(layout, params);
    ranks_.assign(layout.total(), 0);
    for (int i = 0; i < layout.total(); i++) {
        const LightDescriptor& d = layout.descriptor(i);
        ranks_[i] = centerRank(d.zoneIndex, d.zoneCount);
    }
    return true;
}

int CenterOutPattern::rankOf(int globalIndex) const {
    if (globalIndex < 0 || globalIndex >= (int)ranks_.size()) return 0;
    return ranks_[globalIndex];
}

void CenterOutPattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    const int n = layout_->total();
    for (int i = 0; i < n; i++) {
        const LightDescriptor& d = layout_->descriptor(i);
        int lit = litLevels(t, params_->centerPeriod, levelCount(d.zoneCount));
        out.set(i, WARM_BASE, ranks_[i] < lit ? 1.0f : 0.0f);
    }
}

int ZoneMixPattern::configAt(float t, float cycle) {
    if (!(cycle > 0.0f)) cycle = 14.0f;
    if (!(t > 0.0f)) return 0;
    long k = (long)floorf(t / cycle);
    return (int)(k % NUM_CONFIGS);
}

ZoneMixPattern::SubPattern ZoneMixPattern::assignment(int config, Zone zone) {
    // Pairs: left/right = 0, front/back = 1, top/bottom = 2
    int pair = ZoneInfo::toIndex(zone) / 2;
    return (SubPattern)((pair + config) % 4);
}

void ZoneMixPattern::reset() {
    configIndex_ = -1;
    cycleStart_ = 0.0f;
}

void ZoneMixPattern::step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) {
    (void)audio;
    float cycle = params_->zoneMixCycle > 0.0f ? params_->zoneMixCycle : 14.0f;
    int config = configAt(t, cycle);
    if (config != configIndex_) {
        configIndex_ = config;
        cycleStart_ = floorf((t > 0.0f ? t : 0.0f) / cycle) * cycle;
    }
    float localT = (t > 0.0f ? t : 0.0f) - cycleStart_;

    out.clear();
    for (int z = 0; z < NUM_ZONES; z++) {
        Zone zone = ZoneInfo::fromIndex(z);
        stepZone(zone, assignment(configIndex_, zone), localT, out);
    }
}

void ZoneMixPattern::stepZone(Zone zone, SubPattern sub, float localT, LightFrameBuffer& out) {
    const std::vector<int>& lights = layout_->lightsInZone(zone);
    const int n = (int)lights.size();
    if (n == 0) return;

    RGBf color = hsvToRgb(ZoneInfo::toIndex(zone) * 60.0f, 1.0f, 1.0f);

    switch (sub) {
        case SubPattern::CHASE: {
            int tail = params_->chaseTail < n ? params_->chaseTail : n;
            if (tail < 1) tail = 1;
            int head = ChasePattern::headAt(localT, params_->chaseStep, n, false);
            for (int k = 0; k < tail; k++) {
                out.set(lights[(head - k + n) % n], color, 1.0f - (float)k / tail);
            }
            break;
        }
        case SubPattern::BREATHING: {
            float level = BreathingPattern::levelAt(localT, params_->breathPeriod);
            for (int i = 0; i < n; i++) {
                out.set(lights[i], color, level);
            }
            break;
        }
        case SubPattern::SOLID:
            for (int i = 0; i < n; i++) {
                out.set(lights[i], color, 1.0f);
            }
            break;
        case SubPattern::CENTER_OUT: {
            int lit = CenterOutPattern::litLevels(localT, params_->centerPeriod,
                                                  CenterOutPattern::levelCount(n));
            for (int i = 0; i < n; i++) {
                float on = CenterOutPattern::centerRank(i, n) < lit ? 1.0f : 0.0f;
                out.set(lights[i], color, on);
            }
            break;
        }
    }
}
