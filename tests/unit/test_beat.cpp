/**
 * Beat Detector Tests
 */

#include "../LightsTest.h"
#include "../../audiolights/audio/BeatDetector.h"

namespace {
  // Feed a floor below minEnergy so the rolling average settles without firing
  void settle(BeatDetector& detector, float level, int frames, uint32_t& t, uint32_t stepMs) {
    for (int i = 0; i < frames; i++) {
      detector.update(level, t);
      t += stepMs;
    }
  }
}

void testBeatFiresOncePerSpike() {
  TEST_CASE("One Pulse Per Spike");

  BeatDetector detector;
  detector.configure(1.5f, 20, 0.15f, 250);

  uint32_t t = 0;
  settle(detector, 0.1f, 40, t, 12);
  ASSERT_EQUAL((uint32_t)0, detector.beatCount());

  // A spike held across several frames counts once
  ASSERT_TRUE(detector.update(0.9f, t)); t += 12;
  ASSERT_FALSE(detector.update(0.9f, t)); t += 12;
  ASSERT_FALSE(detector.update(0.9f, t)); t += 12;
  ASSERT_EQUAL((uint32_t)1, detector.beatCount());
}

void testBeatRefractory() {
  TEST_CASE("Refractory Interval");

  BeatDetector detector;
  detector.configure(1.5f, 20, 0.15f, 250);

  uint32_t t = 0;
  settle(detector, 0.1f, 40, t, 12);

  ASSERT_TRUE(detector.update(0.9f, t));
  // Drops back (re-arms) and spikes again inside 250ms
  t += 12;
  detector.update(0.1f, t);
  t += 12;
  ASSERT_FALSE(detector.update(1.0f, t));
  ASSERT_EQUAL((uint32_t)1, detector.beatCount());

  // Same pattern after the interval fires
  t += 300;
  detector.update(0.1f, t);
  t += 12;
  ASSERT_TRUE(detector.update(1.0f, t));
  ASSERT_EQUAL((uint32_t)2, detector.beatCount());
}

void testBeatMinimumEnergy() {
  TEST_CASE("Quiet Pulses Ignored");

  BeatDetector detector;
  detector.configure(1.5f, 20, 0.15f, 250);

  uint32_t t = 0;
  settle(detector, 0.01f, 40, t, 12);
  // Far above the average but below the energy floor
  ASSERT_FALSE(detector.update(0.1f, t));
  ASSERT_EQUAL((uint32_t)0, detector.beatCount());
}

void testBeatSteadyToneNeverFires() {
  TEST_CASE("Steady Level Never Fires");

  BeatDetector detector;
  detector.configure(1.5f, 20, 0.15f, 250);

  uint32_t t = 0;
  // First frame against an empty history fires; after that, nothing
  detector.update(0.8f, t);
  t += 12;
  uint32_t before = detector.beatCount();
  settle(detector, 0.8f, 200, t, 12);
  ASSERT_EQUAL(before, detector.beatCount());
}

void testBeatResetKeepsCount() {
  TEST_CASE("Reset Keeps Count");

  BeatDetector detector;
  detector.configure(1.5f, 20, 0.15f, 250);

  uint32_t t = 0;
  settle(detector, 0.1f, 40, t, 12);
  ASSERT_TRUE(detector.update(0.9f, t));
  ASSERT_EQUAL((uint32_t)1, detector.beatCount());

  detector.reset();
  ASSERT_EQUAL((uint32_t)1, detector.beatCount());
  ASSERT_NEAR(0.0f, detector.rollingAverage(), 1e-6f);
}

void runBeatTests() {
  TEST_SUITE("BEAT DETECTOR");
  testBeatFiresOncePerSpike();
  testBeatRefractory();
  testBeatMinimumEnergy();
  testBeatSteadyToneNeverFires();
  testBeatResetKeepsCount();
}
