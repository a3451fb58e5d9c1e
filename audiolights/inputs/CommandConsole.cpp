#include "CommandConsole.h"
#include "../config/DebugLog.h"
#include "../patterns/PatternType.h"
#include <errno.h>
#include <poll.h>
#include <string.h>
#include <system_error>
#include <unistd.h>

CommandConsole::CommandConsole(LightScheduler& scheduler, SettingsRegistry& settings, FILE* out)
    : scheduler_(scheduler), settings_(settings), out_(out),
      stopRequested_(false), quitRequested_(false) {
}

CommandConsole::~CommandConsole() {
    stop();
}

bool CommandConsole::start(int fd) {
    if (thread_.joinable()) return true;
    stopRequested_ = false;
    try {
        thread_ = std::thread(&CommandConsole::threadMain, this, fd);
    } catch (const std::system_error& e) {
        DEBUG_ERROR_F("Console thread failed to start: %s\n", e.what());
        return false;
    }
    return true;
}

void CommandConsole::stop() {
    stopRequested_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void CommandConsole::threadMain(int fd) {
    std::string line;
    char buf[256];

    while (!stopRequested_.load()) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            DEBUG_WARN_F("Console input error: %s\n", strerror(errno));
            return;
        }
        if (ready == 0) continue;

        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            DEBUG_WARN_F("Console input error: %s\n", strerror(errno));
            return;
        }
        if (n == 0) {
            // EOF: the session keeps running without a console
            if (!line.empty()) handleLine(line);
            DEBUG_VERBOSE("Console input closed");
            return;
        }

        for (ssize_t i = 0; i < n; i++) {
            if (buf[i] == '\n') {
                handleLine(line);
                line.clear();
            } else if (line.size() < 255) {
                line += buf[i];
            }
        }
    }
}

void CommandConsole::handleLine(std::string& line) {
    // Trim CR and surrounding spaces
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) return;

    if (!handleCommand(line.c_str() + start)) {
        fprintf(out_, "Unknown command. Try 'help'.\n");
    }
}

bool CommandConsole::handleCommand(const char* cmd) {
    if (!cmd || cmd[0] == '\0') return false;

    if (handlePatternCommand(cmd)) return true;

    if (strcmp(cmd, "status") == 0) {
        printStatus();
        return true;
    }

    if (strcmp(cmd, "help") == 0 || strcmp(cmd, "?") == 0) {
        printHelp();
        return true;
    }

    if (strcmp(cmd, "quit") == 0 || strcmp(cmd, "exit") == 0 || strcmp(cmd, "q") == 0) {
        fprintf(out_, "Stopping...\n");
        quitRequested_ = true;
        scheduler_.requestStop();
        return true;
    }

    // Settings registry handles get/show/categories/settings (set is refused once locked)
    return settings_.handleCommand(cmd);
}

bool CommandConsole::handlePatternCommand(const char* cmd) {
    if (strcmp(cmd, "list") == 0 || strcmp(cmd, "pattern") == 0) {
        printList();
        return true;
    }

    if (strcmp(cmd, "next") == 0 || strcmp(cmd, "n") == 0) {
        PatternType type = PatternTypes::next(scheduler_.activePattern());
        scheduler_.requestPattern(type);
        fprintf(out_, "Pattern: %s\n", PatternTypes::name(type));
        return true;
    }

    if (strcmp(cmd, "prev") == 0 || strcmp(cmd, "p") == 0) {
        PatternType type = PatternTypes::previous(scheduler_.activePattern());
        scheduler_.requestPattern(type);
        fprintf(out_, "Pattern: %s\n", PatternTypes::name(type));
        return true;
    }

    if (strncmp(cmd, "pattern ", 8) == 0) {
        const char* arg = cmd + 8;
        while (*arg == ' ') arg++;

        Result r = scheduler_.requestPatternByName(arg);
        if (r) {
            fprintf(out_, "Pattern: %s\n", arg);
        } else {
            fprintf(out_, "%s (active pattern unchanged). Try 'list'.\n", r.message.c_str());
        }
        return true;
    }

    return false;
}

void CommandConsole::printList() {
    PatternType active = scheduler_.activePattern();
    fprintf(out_, "Available patterns:\n");
    for (int i = 0; i < PatternTypes::NUM_PATTERNS; i++) {
        PatternType type;
        PatternTypes::fromIndex(i, type);
        fprintf(out_, "  %2d  %-16s%s%s\n", i, PatternTypes::name(type),
                PatternTypes::isAudioDriven(type) ? "audio" : "     ",
                type == active ? "  (active)" : "");
    }
}

void CommandConsole::printStatus() {
    SchedulerStats s = scheduler_.stats();
    fprintf(out_, "State: %s  Pattern: %s\n",
            LightScheduler::stateName(scheduler_.state()),
            PatternTypes::name(scheduler_.activePattern()));
    fprintf(out_, "Ticks: %u  Late: %u  Updates: %u  Update failures: %u  Switches: %u\n",
            s.ticks, s.lateTicks, s.updatesSent, s.updateFailures, s.patternSwitches);
    fprintf(out_, "Lights created: %u  removed: %u\n", s.lightsCreated, s.lightsRemoved);
}

void CommandConsole::printHelp() {
    fprintf(out_,
            "Commands:\n"
            "  pattern <name|n>    Switch pattern\n"
            "  next, prev          Step through patterns\n"
            "  list                List patterns\n"
            "  status              Show session status\n"
            "  get <name>          Show a setting\n"
            "  show [category]     Show settings\n"
            "  quit                Stop and remove lights\n");
}
