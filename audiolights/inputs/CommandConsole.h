#pragma once

#include "../render/LightScheduler.h"
#include "../config/SettingsRegistry.h"
#include <atomic>
#include <stdio.h>
#include <string>
#include <thread>

/**
 * CommandConsole - Line commands from a terminal while the session runs
 *
 * Supported Commands:
 *   Patterns:
 *     pattern <name|n>    - Switch at the start of the next tick
 *     next / prev         - Step through patterns in list order
 *     list                - List patterns, marking the active one
 *
 *   Session:
 *     status              - State, active pattern and counters
 *     help                - This list
 *     quit / exit         - Stop the session
 *
 *   Settings (via SettingsRegistry, read-only while running):
 *     get <name>, show [category], categories, settings
 *
 * The reader thread only touches the scheduler's thread-safe calls
 * (requestPattern, requestStop, state, stats).
 */
class CommandConsole {
public:
    CommandConsole(LightScheduler& scheduler, SettingsRegistry& settings, FILE* out = stderr);
    ~CommandConsole();

    /**
     * Read lines from fd on a background thread until stop() or EOF.
     * @return false if the thread could not be started
     */
    bool start(int fd);
    void stop();

    // Execute one command line. Returns false for unknown commands.
    bool handleCommand(const char* cmd);

    bool quitRequested() const { return quitRequested_.load(); }

    // Poll interval of the reader thread (ms)
    static constexpr int POLL_INTERVAL_MS = 100;

private:
    void threadMain(int fd);
    void handleLine(std::string& line);

    bool handlePatternCommand(const char* cmd);
    void printList();
    void printStatus();
    void printHelp();

    LightScheduler& scheduler_;
    SettingsRegistry& settings_;
    FILE* out_;

    std::thread thread_;
    std::atomic<bool> stopRequested_;
    std::atomic<bool> quitRequested_;

    // Prevent copying
    CommandConsole(const CommandConsole&) = delete;
    CommandConsole& operator=(const CommandConsole&) = delete;
};
