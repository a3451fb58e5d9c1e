/**
 * Command Console Tests
 */

#include "../LightsTest.h"
#include "../../audiolights/inputs/CommandConsole.h"
#include "../../audiolights/config/ConfigLoader.h"
#include "../../audiolights/hal/mock/MockHal.h"
#include "../../audiolights/hal/mock/MockTransport.h"
#include <stdio.h>
#include <string.h>
#include <unistd.h>

namespace {
  struct ConsoleFixture {
    MockSystemTime time;
    MockTransport transport;
    SnapshotCell cell;
    LightsConfig config;
    LightLayout layout;
    PatternEngine engine;
    LightScheduler scheduler;
    FILE* sink;
    SettingsRegistry settings;
    CommandConsole console;

    ConsoleFixture()
        : layout(config.zoneCounts, config.geometry),
          scheduler(layout, engine, transport, cell, time),
          sink(tmpfile()),
          settings(sink ? sink : stderr),
          console(scheduler, settings, sink ? sink : stderr) {
      engine.begin(layout, config.patterns);
      ConfigLoader::registerSettings(settings, config);
      scheduler.begin(config.scheduler, PatternType::CHASE);
    }

    ~ConsoleFixture() {
      console.stop();
      if (sink) fclose(sink);
    }

    void tick() {
      time.advanceMillis(33);
      scheduler.tick();
    }
  };
}

void testConsolePatternCommands() {
  TEST_CASE("Console Pattern Commands");

  ConsoleFixture f;
  ASSERT_TRUE(f.scheduler.state() == SchedulerState::RUNNING);

  ASSERT_TRUE(f.console.handleCommand("next"));
  f.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::CHASE_REVERSE);

  ASSERT_TRUE(f.console.handleCommand("p"));
  f.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::CHASE);

  ASSERT_TRUE(f.console.handleCommand("pattern band_split"));
  f.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::BAND_SPLIT);

  ASSERT_TRUE(f.console.handleCommand("pattern 9"));
  f.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::ZONE_MIX);

  // Unknown name is reported and leaves the pattern alone
  ASSERT_TRUE(f.console.handleCommand("pattern disco"));
  f.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::ZONE_MIX);

  ASSERT_TRUE(f.console.handleCommand("list"));
  ASSERT_TRUE(f.console.handleCommand("status"));
  ASSERT_TRUE(f.console.handleCommand("help"));
  ASSERT_FALSE(f.console.handleCommand("dance"));
  ASSERT_FALSE(f.console.handleCommand(""));
}

void testConsoleSettingsLocked() {
  TEST_CASE("Console Settings Are Read Only While Running");

  ConsoleFixture f;
  f.settings.lock();
  float before = f.config.scheduler.updateRate;

  ASSERT_TRUE(f.console.handleCommand("set update_rate 90"));
  ASSERT_NEAR(before, f.config.scheduler.updateRate, 1e-6f);
  ASSERT_TRUE(f.console.handleCommand("get update_rate"));
  ASSERT_TRUE(f.console.handleCommand("show pattern"));
}

void testConsoleQuit() {
  TEST_CASE("Console Quit Stops The Scheduler");

  ConsoleFixture f;
  ASSERT_FALSE(f.scheduler.stopRequested());
  ASSERT_TRUE(f.console.handleCommand("quit"));
  ASSERT_TRUE(f.console.quitRequested());
  ASSERT_TRUE(f.scheduler.stopRequested());
}

void testConsoleReadsFromFd() {
  TEST_CASE("Console Thread Reads Lines");

  ConsoleFixture f;
  int fds[2];
  ASSERT_EQUAL(0, pipe(fds));

  ASSERT_TRUE(f.console.start(fds[0]));
  const char* input = "pattern all_on\nquit\n";
  ASSERT_EQUAL((ssize_t)strlen(input), write(fds[1], input, strlen(input)));

  // Wait for the thread to pick it up
  for (int i = 0; i < 200 && !f.console.quitRequested(); i++) {
    usleep(10000);
  }
  ASSERT_TRUE(f.console.quitRequested());
  ASSERT_TRUE(f.scheduler.stopRequested());

  f.console.stop();
  f.tick();
  ASSERT_TRUE(f.scheduler.activePattern() == PatternType::ALL_ON);

  close(fds[1]);
  close(fds[0]);
}

void runConsoleTests() {
  TEST_SUITE("COMMAND CONSOLE");
  testConsolePatternCommands();
  testConsoleSettingsLocked();
  testConsoleQuit();
  testConsoleReadsFromFd();
}
