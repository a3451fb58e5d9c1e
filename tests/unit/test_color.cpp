/**
 * Color Math Tests
 */

#include "../LightsTest.h"
#include "../../audiolights/patterns/ColorMath.h"
#include "../../audiolights/render/LightFrame.h"
#include <limits>

using namespace ColorMath;

void testHsvPrimaries() {
  TEST_CASE("HSV Primaries");

  RGBf red = hsvToRgb(0.0f, 1.0f, 1.0f);
  ASSERT_NEAR(1.0f, red.r, 1e-5f);
  ASSERT_NEAR(0.0f, red.g, 1e-5f);
  ASSERT_NEAR(0.0f, red.b, 1e-5f);

  RGBf green = hsvToRgb(120.0f, 1.0f, 1.0f);
  ASSERT_NEAR(1.0f, green.g, 1e-5f);
  ASSERT_NEAR(0.0f, green.r, 1e-5f);

  RGBf blue = hsvToRgb(240.0f, 1.0f, 0.5f);
  ASSERT_NEAR(0.5f, blue.b, 1e-5f);

  // 360 wraps to red, negative hues wrap forward
  RGBf wrapped = hsvToRgb(360.0f, 1.0f, 1.0f);
  ASSERT_NEAR(1.0f, wrapped.r, 1e-5f);
  RGBf negative = hsvToRgb(-120.0f, 1.0f, 1.0f);
  ASSERT_NEAR(1.0f, negative.b, 1e-5f);
}

void testHueWrapping() {
  TEST_CASE("Hue Wrapping");

  ASSERT_NEAR(10.0f, wrapHue(370.0f), 1e-4f);
  ASSERT_NEAR(350.0f, wrapHue(-10.0f), 1e-4f);
  ASSERT_RANGE(wrapHue(1e9f), 0.0f, 359.999f);
  ASSERT_EQUAL(0.0f, wrapHue(std::numeric_limits<float>::quiet_NaN()));
  ASSERT_EQUAL(0.0f, wrapHue(std::numeric_limits<float>::infinity()));

  ASSERT_NEAR(0.25f, frac(-0.75f), 1e-6f);
  ASSERT_EQUAL(0.0f, clamp01(std::numeric_limits<float>::quiet_NaN()));
}

void testEnergyToHue() {
  TEST_CASE("Energy To Hue");

  ASSERT_NEAR(0.0f, energyToHue(0.0f), 1e-6f);
  ASSERT_NEAR(300.0f, energyToHue(1.0f), 1e-4f);
  ASSERT_NEAR(300.0f, energyToHue(5.0f), 1e-4f);
  ASSERT_NEAR(150.0f, energyToHue(0.5f), 1e-4f);
}

void testFrameClamp() {
  TEST_CASE("Frame Clamping");

  LightFrame f(RGBf(1.5f, -0.2f, std::numeric_limits<float>::quiet_NaN()), 3.0f);
  f.hasRotation = true;
  f.yawDegrees = -90.0f;
  f.clamp();

  ASSERT_EQUAL(1.0f, f.color.r);
  ASSERT_EQUAL(0.0f, f.color.g);
  ASSERT_EQUAL(0.0f, f.color.b);
  ASSERT_EQUAL(1.0f, f.intensity);
  ASSERT_NEAR(270.0f, f.yawDegrees, 1e-4f);

  // Yaw compares on the circle
  LightFrame a;
  LightFrame b;
  a.hasRotation = b.hasRotation = true;
  a.yawDegrees = 359.9f;
  b.yawDegrees = 0.05f;
  ASSERT_TRUE(a.approxEquals(b, 1e-3f));

  LightFrame c(RGBf(0.5f, 0.5f, 0.5f), 0.5f);
  LightFrame d(RGBf(0.5f, 0.5f, 0.502f), 0.5f);
  ASSERT_FALSE(c.approxEquals(d, 1e-3f));
}

void runColorTests() {
  TEST_SUITE("COLOR MATH");
  testHsvPrimaries();
  testHueWrapping();
  testEnergyToHue();
  testFrameClamp();
}
