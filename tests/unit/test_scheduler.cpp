/**
 * Scheduler Tests
 *
 * Light creation and cleanup, change-only updates, pattern switches at
 * tick boundaries and bounded teardown, all against the mock transport.
 */

#include "../LightsTest.h"
#include "../../audiolights/render/LightScheduler.h"
#include "../../audiolights/hal/mock/MockHal.h"
#include "../../audiolights/hal/mock/MockTransport.h"

namespace {
  const int ROOM_COUNTS[NUM_ZONES] = {5, 5, 3, 2, 4, 0};

  // Everything a scheduler needs, wired to mocks
  struct SchedulerFixture {
    MockSystemTime time;
    MockTransport transport;
    SnapshotCell cell;
    LightLayout layout;
    PatternEngine engine;
    LightScheduler scheduler;

    explicit SchedulerFixture(const int* counts = ROOM_COUNTS)
        : layout(counts, LayoutGeometry()),
          scheduler(layout, engine, transport, cell, time) {
      time.setMillis(5000);
      engine.begin(layout, PatternParams());
    }
  };
}

void testSchedulerCreatesLights() {
  TEST_CASE("Scheduler Creates One Light Per Descriptor");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.state() == SchedulerState::IDLE);

  Result r = f.scheduler.begin(SchedulerParams(), PatternType::CHASE);
  ASSERT_TRUE(r.isOk());
  ASSERT_TRUE(f.scheduler.state() == SchedulerState::RUNNING);
  ASSERT_EQUAL(19, (int)f.transport.created().size());
  ASSERT_EQUAL(19, f.transport.liveCount());
  ASSERT_EQUAL((uint32_t)19, f.scheduler.stats().lightsCreated);

  // Positions come from the layout, in global order
  bool positionsMatch = true;
  for (int i = 0; i < f.layout.total(); i++) {
    const Vec3& expected = f.layout.position(i);
    const Vec3& actual = f.transport.positions()[i];
    if (expected.x != actual.x || expected.y != actual.y || expected.z != actual.z) {
      positionsMatch = false;
    }
  }
  ASSERT_TRUE(positionsMatch);

  // Second begin is refused
  Result again = f.scheduler.begin(SchedulerParams(), PatternType::CHASE);
  ASSERT_FALSE(again.isOk());
  ASSERT_TRUE(again.kind == ErrorKind::CONFIGURATION);
}

void testSchedulerEmptyLayout() {
  TEST_CASE("Empty Layout Is A Configuration Error");

  const int none[NUM_ZONES] = {0, 0, 0, 0, 0, 0};
  SchedulerFixture f(none);
  Result r = f.scheduler.begin(SchedulerParams(), PatternType::CHASE);
  ASSERT_TRUE(r.kind == ErrorKind::CONFIGURATION);
  ASSERT_EQUAL(0, f.transport.createCalls());
}

void testSchedulerCreateFailureCleansUp() {
  TEST_CASE("Create Failure Removes Partial Lights");

  SchedulerFixture f;
  f.transport.failCreateForIndex = 5;

  SchedulerParams params;
  params.createRetries = 3;
  Result r = f.scheduler.begin(params, PatternType::CHASE);

  ASSERT_FALSE(r.isOk());
  ASSERT_TRUE(r.kind == ErrorKind::TRANSPORT);
  ASSERT_EQUAL(5 + 3, f.transport.createCalls());
  ASSERT_EQUAL(5, (int)f.transport.removed().size());
  ASSERT_EQUAL(0, f.transport.liveCount());
  ASSERT_TRUE(f.scheduler.state() == SchedulerState::IDLE);
}

void testSchedulerSendsOnlyChanges() {
  TEST_CASE("Only Changed Lights Are Sent");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.begin(SchedulerParams(), PatternType::ALL_ON).isOk());

  f.scheduler.tick();
  ASSERT_EQUAL(19, (int)f.transport.updates().size());

  f.transport.clearUpdates();
  f.time.advanceMillis(33);
  f.scheduler.tick();
  f.time.advanceMillis(33);
  f.scheduler.tick();
  ASSERT_EQUAL(0, (int)f.transport.updates().size());
  ASSERT_EQUAL((uint32_t)3, f.scheduler.stats().ticks);
  ASSERT_EQUAL((uint32_t)19, f.scheduler.stats().updatesSent);
}

void testSchedulerChaseDiff() {
  TEST_CASE("Chase Step Sends Four Updates");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.begin(SchedulerParams(), PatternType::CHASE).isOk());

  f.scheduler.tick();
  f.transport.clearUpdates();

  // Head moves 0 -> 1: new head, two dimmer tail lights, one light going dark
  f.time.advanceMillis(100);
  f.scheduler.tick();
  ASSERT_EQUAL(4, (int)f.transport.updates().size());

  const LightFrameBuffer& last = f.scheduler.lastFrame();
  ASSERT_NEAR(1.0f, last.get(1).intensity, 1e-5f);
  ASSERT_EQUAL(0.0f, last.get(17).intensity);
}

void testSchedulerSwitchOnNextTick() {
  TEST_CASE("Pattern Switch Applies At Next Tick");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.begin(SchedulerParams(), PatternType::CHASE).isOk());
  f.scheduler.tick();

  f.scheduler.requestPattern(PatternType::ALL_ON);
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::CHASE);

  f.time.advanceMillis(33);
  f.scheduler.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::ALL_ON);
  ASSERT_EQUAL((uint32_t)1, f.scheduler.stats().patternSwitches);
  ASSERT_EQUAL(1.0f, f.scheduler.lastFrame().get(10).intensity);

  // Last request before a tick wins
  f.scheduler.requestPattern(PatternType::SWIRL);
  f.scheduler.requestPattern(PatternType::BREATHING);
  f.time.advanceMillis(33);
  f.scheduler.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::BREATHING);
  ASSERT_EQUAL((uint32_t)2, f.scheduler.stats().patternSwitches);

  Result bad = f.scheduler.requestPatternByName("strobe");
  ASSERT_TRUE(bad.kind == ErrorKind::PATTERN);
  ASSERT_TRUE(f.scheduler.requestPatternByName("5").isOk());
  f.time.advanceMillis(33);
  f.scheduler.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::LEFT_OFF);
}

void testSchedulerResendsFailedUpdates() {
  TEST_CASE("Failed Updates Are Resent");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.begin(SchedulerParams(), PatternType::ALL_ON).isOk());

  f.transport.failAllUpdates = true;
  f.scheduler.tick();
  ASSERT_EQUAL(0, (int)f.transport.updates().size());
  ASSERT_EQUAL((uint32_t)19, f.scheduler.stats().updateFailures);
  ASSERT_TRUE(f.scheduler.state() == SchedulerState::RUNNING);

  // Frame did not change, but the host never saw it
  f.transport.failAllUpdates = false;
  f.time.advanceMillis(33);
  f.scheduler.tick();
  ASSERT_EQUAL(19, (int)f.transport.updates().size());
}

void testSchedulerUsesAudio() {
  TEST_CASE("Scheduler Reads Fresh Audio");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.begin(SchedulerParams(), PatternType::BAND_SPLIT).isOk());

  AudioSnapshot s;
  s.low = 0.8f;
  s.overall = 0.5f;
  s.timestampMs = f.time.millis();
  f.cell.publish(s);

  f.scheduler.tick();
  ASSERT_NEAR(0.8f, f.scheduler.lastFrame().get(0).intensity, 1e-5f);

  // Stale snapshot falls back to the idle look
  f.time.advanceMillis(2000);
  f.scheduler.tick();
  ASSERT_NEAR(PatternParams().idleIntensity, f.scheduler.lastFrame().get(0).intensity, 1e-5f);
}

void testSchedulerRotation() {
  TEST_CASE("Whole Rig Rotation");

  SchedulerFixture f;
  SchedulerParams params;
  params.rotationEnabled = true;
  params.rotationSpeed = 90.0f;
  params.rotationAudioBoost = false;
  ASSERT_TRUE(f.scheduler.begin(params, PatternType::ALL_ON).isOk());

  f.scheduler.tick();
  f.time.advanceMillis(1000);
  f.scheduler.tick();
  ASSERT_NEAR(90.0f, f.scheduler.rotationYaw(), 1e-2f);
  ASSERT_TRUE(f.scheduler.lastFrame().get(0).hasRotation);
  ASSERT_NEAR(90.0f, f.scheduler.lastFrame().get(0).yawDegrees, 1e-2f);
}

void testSchedulerRunLoop() {
  TEST_CASE("Run Loop Holds The Update Rate");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.begin(SchedulerParams(), PatternType::CHASE).isOk());

  f.scheduler.run(1000);
  ASSERT_RANGE(f.scheduler.stats().ticks, 29, 31);
  ASSERT_EQUAL((uint32_t)0, f.scheduler.stats().lateTicks);
  ASSERT_TRUE(f.time.delayCalls() > 0);

  // A stop request ends run() before the duration elapses
  f.scheduler.requestStop();
  uint32_t before = f.scheduler.stats().ticks;
  f.scheduler.run(1000);
  ASSERT_EQUAL(before, f.scheduler.stats().ticks);
}

void testSchedulerLateTicksResync() {
  TEST_CASE("Slow Transport Resyncs Instead Of Bursting");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.begin(SchedulerParams(), PatternType::SWIRL).isOk());

  // Every update costs 5ms: 19 lights take ~95ms per tick at 30 Hz
  f.transport.attachClock(&f.time, 5);
  f.scheduler.run(1000);

  SchedulerStats stats = f.scheduler.stats();
  ASSERT_TRUE(stats.lateTicks > 0);
  ASSERT_TRUE(stats.ticks < 30);
}

void testSchedulerShutdown() {
  TEST_CASE("Shutdown Removes Every Light");

  SchedulerFixture f;
  ASSERT_TRUE(f.scheduler.begin(SchedulerParams(), PatternType::CHASE).isOk());
  f.scheduler.tick();

  ASSERT_EQUAL(19, f.scheduler.shutdown());
  ASSERT_EQUAL(0, f.transport.liveCount());
  ASSERT_TRUE(f.scheduler.state() == SchedulerState::TERMINATED);

  // Idempotent
  ASSERT_EQUAL(0, f.scheduler.shutdown());
  ASSERT_EQUAL(19, f.transport.removeCalls());

  // Ticks after teardown do nothing
  f.transport.clearUpdates();
  f.scheduler.tick();
  ASSERT_EQUAL(0, (int)f.transport.updates().size());
}

void testSchedulerShutdownBounded() {
  TEST_CASE("Shutdown Bounded When Host Never Answers");

  SchedulerFixture f;
  SchedulerParams params;
  params.teardownTimeoutMs = 500;
  params.removeRetries = 2;
  ASSERT_TRUE(f.scheduler.begin(params, PatternType::CHASE).isOk());

  f.transport.failAllRemoves = true;
  f.transport.attachClock(&f.time, 50);

  uint32_t start = f.time.millis();
  int removed = f.scheduler.shutdown();
  uint32_t elapsed = f.time.millis() - start;

  ASSERT_EQUAL(0, removed);
  ASSERT_TRUE(elapsed <= 500 + 50);
  ASSERT_TRUE(f.transport.removeCalls() <= 11);
  ASSERT_TRUE(f.scheduler.state() == SchedulerState::TERMINATED);
  ASSERT_TRUE(f.scheduler.stats().removeFailures > 0);
}

void testSchedulerShutdownBeforeBegin() {
  TEST_CASE("Shutdown Before Begin");

  SchedulerFixture f;
  ASSERT_EQUAL(0, f.scheduler.shutdown());
  ASSERT_TRUE(f.scheduler.state() == SchedulerState::TERMINATED);
  ASSERT_EQUAL(0, f.transport.removeCalls());
}

void runSchedulerTests() {
  TEST_SUITE("SCHEDULER");
  testSchedulerCreatesLights();
  testSchedulerEmptyLayout();
  testSchedulerCreateFailureCleansUp();
  testSchedulerSendsOnlyChanges();
  testSchedulerChaseDiff();
  testSchedulerSwitchOnNextTick();
  testSchedulerResendsFailedUpdates();
  testSchedulerUsesAudio();
  testSchedulerRotation();
  testSchedulerRunLoop();
  testSchedulerLateTicksResync();
  testSchedulerShutdown();
  testSchedulerShutdownBounded();
  testSchedulerShutdownBeforeBegin();
}
