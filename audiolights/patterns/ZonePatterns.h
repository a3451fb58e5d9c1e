#pragma once
#include "Pattern.h"
#include <vector>

/**
 * ZoneOffPattern - One zone dark, every other light on
 *
 * LEFT gives left_off, RIGHT gives right_off.
 */
class ZoneOffPattern : public Pattern {
public:
    explicit ZoneOffPattern(Zone darkZone) : darkZone_(darkZone) {}

    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override {}
    PatternType getType() const override {
        return darkZone_ == Zone::RIGHT ? PatternType::RIGHT_OFF : PatternType::LEFT_OFF;
    }

private:
    Zone darkZone_;
};

/**
 * LeftRightAltPattern - Left and right walls take turns; others stay at half
 */
class LeftRightAltPattern : public Pattern {
public:
    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override { leftLit_ = true; }
    PatternType getType() const override { return PatternType::LEFT_RIGHT_ALT; }

    bool leftLit() const { return leftLit_; }

private:
    bool leftLit_ = true;
};

/**
 * CenterOutPattern - Each zone lights from its middle outward
 *
 * Rank is the distance level from the zone midpoint (0 = middle light,
 * or the middle pair for even counts). Over one period the number of lit
 * levels grows from none to all; zones of different sizes finish together.
 */
class CenterOutPattern : public Pattern {
public:
    bool begin(const LightLayout& layout, const PatternParams& params) override;
    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override {}
    PatternType getType() const override { return PatternType::CENTER_OUT; }

    static int centerRank(int zoneIndex, int zoneCount);
    static int levelCount(int zoneCount) { return zoneCount > 0 ? (zoneCount - 1) / 2 + 1 : 0; }

    // Levels lit at local time t for a zone with `levels` levels
    static int litLevels(float t, float period, int levels);

    int rankOf(int globalIndex) const;

private:
    std::vector<int> ranks_;     // Per light, computed once per layout
};

/**
 * ZoneMixPattern - Every zone runs its own sub-pattern
 *
 * Zone pairs (left/right, front/back, top/bottom) share a sub-pattern.
 * The assignment rotates through four configurations, one per
 * zoneMixCycle seconds: configuration = floor(t / cycle) mod 4. Each zone
 * keeps a fixed hue so the mix stays readable.
 */
class ZoneMixPattern : public Pattern {
public:
    enum class SubPattern : uint8_t {
        CHASE,
        BREATHING,
        SOLID,
        CENTER_OUT
    };

    static constexpr int NUM_CONFIGS = 4;

    void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) override;
    void reset() override;
    PatternType getType() const override { return PatternType::ZONE_MIX; }

    static int configAt(float t, float cycle);
    static SubPattern assignment(int config, Zone zone);

    int configIndex() const { return configIndex_; }
    float cycleStart() const { return cycleStart_; }

private:
    void stepZone(Zone zone, SubPattern sub, float localT, LightFrameBuffer& out);

    int configIndex_ = -1;
    float cycleStart_ = 0.0f;
};
