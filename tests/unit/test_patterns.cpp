/**
 * Pattern Tests
 *
 * Per-pattern behavior on the default room layout, driven through the
 * engine the same way the scheduler drives it.
 */

#include "../LightsTest.h"
#include "../../audiolights/patterns/PatternEngine.h"
#include "../../audiolights/patterns/ChasePattern.h"
#include "../../audiolights/patterns/ZonePatterns.h"
#include "../../audiolights/patterns/AmbientPatterns.h"
#include "../../audiolights/patterns/AudioPatterns.h"
#include "../../audiolights/patterns/ColorMath.h"
#include <stdlib.h>

namespace {
  const int ROOM_COUNTS[NUM_ZONES] = {5, 5, 3, 2, 4, 0};

  AudioSnapshot loudSnapshot(float low, float mid, float high, uint32_t beats = 0) {
    AudioSnapshot s;
    s.low = low;
    s.mid = mid;
    s.high = high;
    s.overall = (low + mid + high) / 3.0f;
    s.beatCount = beats;
    return s;
  }

  int countLit(const LightFrameBuffer& out) {
    int lit = 0;
    for (int i = 0; i < out.size(); i++) {
      if (out.get(i).intensity > 0.0f) lit++;
    }
    return lit;
  }

  bool buffersEqual(const LightFrameBuffer& a, const LightFrameBuffer& b) {
    if (a.size() != b.size()) return false;
    for (int i = 0; i < a.size(); i++) {
      const LightFrame& fa = a.get(i);
      const LightFrame& fb = b.get(i);
      if (fa.intensity != fb.intensity || fa.color.r != fb.color.r ||
          fa.color.g != fb.color.g || fa.color.b != fb.color.b ||
          fa.hasRotation != fb.hasRotation || fa.yawDegrees != fb.yawDegrees) {
        return false;
      }
    }
    return true;
  }
}

void testPatternDeterminism() {
  TEST_CASE("Patterns Are Deterministic");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternParams params;
  PatternEngine a;
  PatternEngine b;
  ASSERT_TRUE(a.begin(layout, params));
  ASSERT_TRUE(b.begin(layout, params));

  LightFrameBuffer outA;
  LightFrameBuffer outB;
  AudioSnapshot audio = loudSnapshot(0.4f, 0.3f, 0.7f, 2);

  bool allEqual = true;
  for (int p = 0; p < PatternTypes::NUM_PATTERNS; p++) {
    PatternType type;
    PatternTypes::fromIndex(p, type);
    a.setPattern(type, 0.0f);
    b.setPattern(type, 0.0f);
    for (int k = 0; k < 20; k++) {
      float t = k * 0.37f;
      a.step(audio, t, outA);
      b.step(audio, t, outB);
      if (!buffersEqual(outA, outB)) allEqual = false;
    }
  }
  ASSERT_TRUE(allEqual);
}

void testChasePattern() {
  TEST_CASE("Chase Head And Tail");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  ASSERT_TRUE(engine.setPattern(PatternType::CHASE, 0.0f));

  LightFrameBuffer out;
  engine.step(AudioSnapshot::silence(), 0.05f, out);
  ASSERT_EQUAL(19, out.size());
  ASSERT_EQUAL(3, countLit(out));

  // Head at 0, tail wraps to the end of the global order
  ASSERT_NEAR(1.0f, out.get(0).intensity, 1e-5f);
  ASSERT_TRUE(out.get(0).intensity > out.get(18).intensity);
  ASSERT_TRUE(out.get(18).intensity > out.get(17).intensity);
  ASSERT_TRUE(out.get(17).intensity > 0.0f);

  engine.step(AudioSnapshot::silence(), 0.55f, out);
  ASSERT_NEAR(1.0f, out.get(5).intensity, 1e-5f);
  ASSERT_EQUAL(0.0f, out.get(0).intensity);

  // One full lap returns to the start
  ASSERT_EQUAL(0, ChasePattern::headAt(1.95f, 0.1f, 19, false));
  ASSERT_EQUAL(18, ChasePattern::headAt(0.0f, 0.1f, 19, true));
  ASSERT_EQUAL(-1, ChasePattern::headAt(1.0f, 0.1f, 0, false));
}

void testChaseReverse() {
  TEST_CASE("Chase Reverse");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  ASSERT_TRUE(engine.setPattern(PatternType::CHASE_REVERSE, 0.0f));

  LightFrameBuffer out;
  engine.step(AudioSnapshot::silence(), 0.15f, out);
  ChasePattern* chase = static_cast<ChasePattern*>(engine.getCurrentPattern());
  ASSERT_EQUAL(17, chase->headIndex());
  ASSERT_EQUAL(3, countLit(out));
  // Trail follows behind a head moving downward
  ASSERT_TRUE(out.get(17).intensity > out.get(18).intensity);
  ASSERT_TRUE(out.get(18).intensity > out.get(0).intensity);
  ASSERT_TRUE(out.get(0).intensity > 0.0f);
}

void testChaseSmallLayout() {
  TEST_CASE("Chase Tail Longer Than Layout");

  const int counts[NUM_ZONES] = {2, 0, 0, 0, 0, 0};
  LightLayout layout(counts, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));

  LightFrameBuffer out;
  engine.step(AudioSnapshot::silence(), 0.0f, out);
  ASSERT_EQUAL(2, out.size());
  ASSERT_EQUAL(2, countLit(out));
}

void testZoneOffPatterns() {
  TEST_CASE("Left Off And Right Off");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  LightFrameBuffer out;

  engine.setPattern(PatternType::LEFT_OFF, 0.0f);
  engine.step(AudioSnapshot::silence(), 3.0f, out);
  bool ok = true;
  for (int i = 0; i < layout.total(); i++) {
    float expected = layout.descriptor(i).zone == Zone::LEFT ? 0.0f : 1.0f;
    if (out.get(i).intensity != expected) ok = false;
  }
  ASSERT_TRUE(ok);

  engine.setPattern(PatternType::RIGHT_OFF, 0.0f);
  engine.step(AudioSnapshot::silence(), 3.0f, out);
  ASSERT_EQUAL(0.0f, out.get(layout.globalIndex(Zone::RIGHT, 2)).intensity);
  ASSERT_EQUAL(1.0f, out.get(layout.globalIndex(Zone::LEFT, 2)).intensity);
}

void testLeftRightAlternation() {
  TEST_CASE("Left Right Alternation");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  engine.setPattern(PatternType::LEFT_RIGHT_ALT, 0.0f);
  LightFrameBuffer out;

  int left = layout.globalIndex(Zone::LEFT, 0);
  int right = layout.globalIndex(Zone::RIGHT, 0);
  int front = layout.globalIndex(Zone::FRONT, 0);

  engine.step(AudioSnapshot::silence(), 0.5f, out);
  ASSERT_EQUAL(1.0f, out.get(left).intensity);
  ASSERT_EQUAL(0.0f, out.get(right).intensity);
  ASSERT_NEAR(0.5f, out.get(front).intensity, 1e-6f);

  engine.step(AudioSnapshot::silence(), 1.5f, out);
  ASSERT_EQUAL(0.0f, out.get(left).intensity);
  ASSERT_EQUAL(1.0f, out.get(right).intensity);
}

void testCenterOut() {
  TEST_CASE("Center Out Reveal");

  ASSERT_EQUAL(0, CenterOutPattern::centerRank(2, 5));
  ASSERT_EQUAL(1, CenterOutPattern::centerRank(1, 5));
  ASSERT_EQUAL(2, CenterOutPattern::centerRank(4, 5));
  // Even counts: the middle pair shares rank 0
  ASSERT_EQUAL(0, CenterOutPattern::centerRank(1, 4));
  ASSERT_EQUAL(0, CenterOutPattern::centerRank(2, 4));
  ASSERT_EQUAL(1, CenterOutPattern::centerRank(0, 4));
  ASSERT_EQUAL(3, CenterOutPattern::levelCount(5));
  ASSERT_EQUAL(2, CenterOutPattern::levelCount(4));

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  engine.setPattern(PatternType::CENTER_OUT, 0.0f);
  LightFrameBuffer out;

  // Start of the period is dark
  engine.step(AudioSnapshot::silence(), 0.0f, out);
  ASSERT_EQUAL(0, countLit(out));

  // Left wall (3 levels) at 0.6s of 2s: one level lit, the middle light
  engine.step(AudioSnapshot::silence(), 0.6f, out);
  ASSERT_EQUAL(1.0f, out.get(layout.globalIndex(Zone::LEFT, 2)).intensity);
  ASSERT_EQUAL(0.0f, out.get(layout.globalIndex(Zone::LEFT, 1)).intensity);

  // Late in the period every light is on
  engine.step(AudioSnapshot::silence(), 1.9f, out);
  ASSERT_EQUAL(layout.total(), countLit(out));
}

void testZoneMixBoundaries() {
  TEST_CASE("Zone Mix Configuration Boundaries");

  ASSERT_EQUAL(0, ZoneMixPattern::configAt(0.0f, 14.0f));
  ASSERT_EQUAL(0, ZoneMixPattern::configAt(13.99f, 14.0f));
  ASSERT_EQUAL(1, ZoneMixPattern::configAt(14.0f, 14.0f));
  ASSERT_EQUAL(3, ZoneMixPattern::configAt(42.5f, 14.0f));
  ASSERT_EQUAL(0, ZoneMixPattern::configAt(56.0f, 14.0f));

  // Pairs share a sub-pattern and rotate with the configuration
  ASSERT_TRUE(ZoneMixPattern::assignment(0, Zone::LEFT) == ZoneMixPattern::assignment(0, Zone::RIGHT));
  ASSERT_TRUE(ZoneMixPattern::assignment(0, Zone::TOP) == ZoneMixPattern::assignment(0, Zone::BOTTOM));
  ASSERT_TRUE(ZoneMixPattern::assignment(0, Zone::LEFT) == ZoneMixPattern::SubPattern::CHASE);
  ASSERT_TRUE(ZoneMixPattern::assignment(1, Zone::LEFT) == ZoneMixPattern::SubPattern::BREATHING);
  ASSERT_TRUE(ZoneMixPattern::assignment(1, Zone::FRONT) == ZoneMixPattern::SubPattern::SOLID);

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  engine.setPattern(PatternType::ZONE_MIX, 0.0f);
  ZoneMixPattern* mix = static_cast<ZoneMixPattern*>(engine.getCurrentPattern());
  LightFrameBuffer out;

  engine.step(AudioSnapshot::silence(), 13.9f, out);
  ASSERT_EQUAL(0, mix->configIndex());

  engine.step(AudioSnapshot::silence(), 14.05f, out);
  ASSERT_EQUAL(1, mix->configIndex());
  ASSERT_NEAR(14.0f, mix->cycleStart(), 1e-4f);

  // Config 1 puts front/back on solid
  ASSERT_EQUAL(1.0f, out.get(layout.globalIndex(Zone::FRONT, 0)).intensity);
  ASSERT_EQUAL(1.0f, out.get(layout.globalIndex(Zone::BACK, 1)).intensity);
}

void testBreathingAndAllOn() {
  TEST_CASE("Breathing And All On");

  ASSERT_NEAR(0.1f, BreathingPattern::levelAt(0.0f, 4.0f), 1e-5f);
  ASSERT_NEAR(1.0f, BreathingPattern::levelAt(2.0f, 4.0f), 1e-5f);
  ASSERT_NEAR(0.1f, BreathingPattern::levelAt(4.0f, 4.0f), 1e-4f);

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  engine.setPattern(PatternType::ALL_ON, 0.0f);
  LightFrameBuffer out;
  engine.step(AudioSnapshot::silence(), 7.0f, out);
  ASSERT_EQUAL(layout.total(), countLit(out));
  ASSERT_EQUAL(1.0f, out.get(3).intensity);
  ASSERT_NEAR(ColorMath::WARM_BASE.g, out.get(3).color.g, 1e-6f);
}

void testSwirlRotation() {
  TEST_CASE("Swirl Sets Rotation");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  engine.setPattern(PatternType::SWIRL, 0.0f);
  LightFrameBuffer out;
  engine.step(AudioSnapshot::silence(), 1.0f, out);

  bool allRotated = true;
  for (int i = 0; i < out.size(); i++) {
    if (!out.get(i).hasRotation) allRotated = false;
  }
  ASSERT_TRUE(allRotated);
  ASSERT_TRUE(countLit(out) == layout.total());
}

void testAudioPatternsIdleUnderSilence() {
  TEST_CASE("Audio Patterns Idle Under Silence");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternParams params;
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, params));
  LightFrameBuffer out;

  bool allIdle = true;
  for (int p = PatternTypes::FIRST_AUDIO_PATTERN; p < PatternTypes::NUM_PATTERNS; p++) {
    PatternType type;
    PatternTypes::fromIndex(p, type);
    ASSERT_TRUE(PatternTypes::isAudioDriven(type));
    engine.setPattern(type, 0.0f);
    engine.step(AudioSnapshot::silence(), 2.0f, out);
    for (int i = 0; i < out.size(); i++) {
      const LightFrame& f = out.get(i);
      if (f.intensity != params.idleIntensity || f.color.r != ColorMath::WARM_BASE.r ||
          f.color.g != ColorMath::WARM_BASE.g || f.color.b != ColorMath::WARM_BASE.b) {
        allIdle = false;
      }
    }
  }
  ASSERT_TRUE(allIdle);
  ASSERT_FALSE(PatternTypes::isAudioDriven(PatternType::ALL_ON));
}

void testBandSplit() {
  TEST_CASE("Band Split");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  engine.setPattern(PatternType::BAND_SPLIT, 0.0f);
  LightFrameBuffer out;

  // No treble: hue 0 (red), intensity follows bass
  engine.step(loudSnapshot(0.6f, 0.2f, 0.0f), 1.0f, out);
  ASSERT_NEAR(0.6f, out.get(0).intensity, 1e-5f);
  ASSERT_NEAR(1.0f, out.get(0).color.r, 1e-5f);
  ASSERT_NEAR(0.0f, out.get(0).color.b, 1e-5f);

  // Treble at 2/3 turns the hue to blue
  engine.step(loudSnapshot(0.3f, 0.2f, 2.0f / 3.0f), 1.0f, out);
  ASSERT_NEAR(0.3f, out.get(7).intensity, 1e-5f);
  ASSERT_NEAR(1.0f, out.get(7).color.b, 1e-3f);
}

void testBeatHueSteps() {
  TEST_CASE("Beat Hue Steps By Golden Angle");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  engine.setPattern(PatternType::BEAT_HUE, 0.0f);
  BeatHuePattern* beatHue = static_cast<BeatHuePattern*>(engine.getCurrentPattern());
  LightFrameBuffer out;

  // First snapshot only establishes the baseline count
  engine.step(loudSnapshot(0.5f, 0.5f, 0.5f, 10), 0.1f, out);
  ASSERT_NEAR(0.0f, beatHue->currentHue(), 1e-4f);

  engine.step(loudSnapshot(0.5f, 0.5f, 0.5f, 11), 0.2f, out);
  ASSERT_NEAR(ColorMath::GOLDEN_ANGLE, beatHue->currentHue(), 1e-3f);

  // Two pulses between reads advance twice
  engine.step(loudSnapshot(0.5f, 0.5f, 0.5f, 13), 0.3f, out);
  ASSERT_NEAR(ColorMath::wrapHue(ColorMath::GOLDEN_ANGLE * 3.0f), beatHue->currentHue(), 1e-3f);

  // Same count: no change
  engine.step(loudSnapshot(0.5f, 0.5f, 0.5f, 13), 0.4f, out);
  ASSERT_NEAR(ColorMath::wrapHue(ColorMath::GOLDEN_ANGLE * 3.0f), beatHue->currentHue(), 1e-3f);
  ASSERT_NEAR(0.5f, out.get(0).intensity, 1e-5f);
}

void testBassFloodFlash() {
  TEST_CASE("Bass Flood Flashes On Beat");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  engine.setPattern(PatternType::BASS_FLOOD, 0.0f);
  LightFrameBuffer out;

  engine.step(loudSnapshot(0.2f, 0.1f, 0.1f, 4), 0.1f, out);
  ASSERT_TRUE(out.get(0).intensity < 1.0f);

  engine.step(loudSnapshot(0.2f, 0.1f, 0.1f, 5), 0.2f, out);
  ASSERT_EQUAL(1.0f, out.get(0).intensity);

  engine.step(loudSnapshot(0.2f, 0.1f, 0.1f, 5), 0.3f, out);
  ASSERT_TRUE(out.get(0).intensity < 1.0f);
}

void testPatternOutputRangeFuzz() {
  TEST_CASE("Pattern Output Range Fuzz");

  LightLayout layout(ROOM_COUNTS, LayoutGeometry());
  PatternEngine engine;
  ASSERT_TRUE(engine.begin(layout, PatternParams()));
  LightFrameBuffer out;

  srand(1234);
  bool inRange = true;
  for (int p = 0; p < PatternTypes::NUM_PATTERNS; p++) {
    PatternType type;
    PatternTypes::fromIndex(p, type);
    engine.setPattern(type, 0.0f);
    uint32_t beats = 0;
    for (int k = 0; k < 200; k++) {
      float t = (float)(rand() % 100000) / 37.0f;
      AudioSnapshot s = loudSnapshot((rand() % 1000) / 999.0f, (rand() % 1000) / 999.0f,
                                     (rand() % 1000) / 999.0f, beats);
      beats += (uint32_t)(rand() % 3);
      engine.step(s, t, out);
      for (int i = 0; i < out.size(); i++) {
        LightFrame f = out.get(i);
        f.clamp();
        if (!(f.intensity >= 0.0f && f.intensity <= 1.0f)) inRange = false;
        if (!(f.color.r >= 0.0f && f.color.r <= 1.0f)) inRange = false;
        if (!(f.color.g >= 0.0f && f.color.g <= 1.0f)) inRange = false;
        if (!(f.color.b >= 0.0f && f.color.b <= 1.0f)) inRange = false;
        // Raw pattern output is already in range
        const LightFrame& raw = out.get(i);
        if (raw.intensity < 0.0f || raw.intensity > 1.0f) inRange = false;
      }
    }
  }
  ASSERT_TRUE(inRange);
}

void runPatternTests() {
  TEST_SUITE("PATTERNS");
  testPatternDeterminism();
  testChasePattern();
  testChaseReverse();
  testChaseSmallLayout();
  testZoneOffPatterns();
  testLeftRightAlternation();
  testCenterOut();
  testZoneMixBoundaries();
  testBreathingAndAllOn();
  testSwirlRotation();
  testAudioPatternsIdleUnderSilence();
  testBandSplit();
  testBeatHueSteps();
  testBassFloodFlash();
  testPatternOutputRangeFuzz();
}
