#pragma once

#include <stdio.h>

/**
 * DebugLog.h - Compile-time debug level system
 *
 * Provides DEBUG_ERROR, DEBUG_WARN, DEBUG_INFO, and DEBUG_VERBOSE macros
 * that compile out below the configured level. Output goes to stderr
 * because stdout may be carrying the transport message stream.
 *
 * Usage:
 *   #include "config/DebugLog.h"
 *
 *   DEBUG_ERROR("Transport refused light creation");
 *   DEBUG_WARN_F("Dropped malformed audio block (%d samples)\n", count);
 *   DEBUG_INFO("Scheduler running");
 *   DEBUG_VERBOSE_F("Tick %u late by %u ms\n", tick, lateMs);
 *
 * Debug Levels:
 *   0 = NONE    - All debug output disabled
 *   1 = ERROR   - Only critical errors
 *   2 = WARN    - Errors + warnings
 *   3 = INFO    - Errors + warnings + general info (default)
 *   4 = VERBOSE - All debug output including per-tick diagnostics
 *
 * Set DEBUG_LEVEL from the build:
 *   cmake -DAUDIOLIGHTS_DEBUG_LEVEL=4 ...
 *
 * The runtime --verbose flag raises the level up to the compiled maximum
 * through DebugLog::verbose.
 */

#ifndef DEBUG_LEVEL
#define DEBUG_LEVEL 4  // Compiled in; runtime gate below keeps VERBOSE quiet by default
#endif

namespace DebugLog {
    // Set once at startup before any worker thread exists
    extern bool verbose;
}

#if DEBUG_LEVEL >= 1
  #define DEBUG_ERROR(x) fprintf(stderr, "[ERROR] %s\n", x)
  #define DEBUG_ERROR_F(fmt, ...) fprintf(stderr, "[ERROR] " fmt, __VA_ARGS__)
#else
  #define DEBUG_ERROR(x) ((void)0)
  #define DEBUG_ERROR_F(fmt, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 2
  #define DEBUG_WARN(x) fprintf(stderr, "[WARN] %s\n", x)
  #define DEBUG_WARN_F(fmt, ...) fprintf(stderr, "[WARN] " fmt, __VA_ARGS__)
#else
  #define DEBUG_WARN(x) ((void)0)
  #define DEBUG_WARN_F(fmt, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 3
  #define DEBUG_INFO(x) fprintf(stderr, "[INFO] %s\n", x)
  #define DEBUG_INFO_F(fmt, ...) fprintf(stderr, "[INFO] " fmt, __VA_ARGS__)
#else
  #define DEBUG_INFO(x) ((void)0)
  #define DEBUG_INFO_F(fmt, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 4
  #define DEBUG_VERBOSE(x) \
    do { if (::DebugLog::verbose) fprintf(stderr, "[VERBOSE] %s\n", x); } while(0)
  #define DEBUG_VERBOSE_F(fmt, ...) \
    do { if (::DebugLog::verbose) fprintf(stderr, "[VERBOSE] " fmt, __VA_ARGS__); } while(0)
#else
  #define DEBUG_VERBOSE(x) ((void)0)
  #define DEBUG_VERBOSE_F(fmt, ...) ((void)0)
#endif

// Utility: Print with label
#if DEBUG_LEVEL >= 3
  #define DEBUG_PRINT_VAR(name, value) \
    fprintf(stderr, "[INFO] %s: %g\n", name, (double)(value))
#else
  #define DEBUG_PRINT_VAR(name, value) ((void)0)
#endif
