/**
 * Audio Lights Test Runner
 *
 * Runs every unit suite and exits non-zero if any assertion failed.
 *   ./audiolights_tests            all suites
 *   ./audiolights_tests -v         with engine logging
 */

#include "LightsTest.h"
#include "../audiolights/config/DebugLog.h"
#include "../audiolights/types/LightsAssert.h"
#include <string.h>

// Test globals
TestResults testResults;
const char* currentTestCase = "";

// Suites
void runLayoutTests();
void runColorTests();
void runAnalyzerTests();
void runBeatTests();
void runPatternTests();
void runEngineTests();
void runSchedulerTests();
void runConfigTests();
void runSourceTests();
void runTransportTests();
void runConsoleTests();

int main(int argc, char** argv) {
  DebugLog::verbose = argc > 1 && strcmp(argv[1], "-v") == 0;

  TEST_BEGIN();

  runLayoutTests();
  runColorTests();
  runAnalyzerTests();
  runBeatTests();
  runPatternTests();
  runEngineTests();
  runSchedulerTests();
  runConfigTests();
  runSourceTests();
  runTransportTests();
  runConsoleTests();

  // Internal invariant checks must stay quiet under test
  TEST_CASE("No Internal Assertion Failures");
  ASSERT_EQUAL((uint32_t)0, LightsAssert::failCount.load());

  TEST_END();
  return testResults.failedTests == 0 ? 0 : 1;
}
