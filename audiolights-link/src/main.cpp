/**
 * audiolights-link - Audio-reactive point lights for a remote 3D host
 *
 * Builds the light layout, analyzes an audio stream and drives the lights
 * at a fixed rate. Host messages go out as JSON lines (stdout by default)
 * for a WebSocket bridge to forward.
 *
 * Usage:
 *   audiolights-link --tone 120 --pattern bass_flood
 *   audiolights-link --audio-cmd "parec --format=s16le --channels=1 --rate=44100" -o lights.jsonl
 *   audiolights-link --demo --layout left=4,right=4,top=2 --duration 10
 *   audiolights-link --help
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

#include "JsonLineTransport.h"

#include "../../audiolights/config/DebugLog.h"
#include "../../audiolights/config/LightsConfig.h"
#include "../../audiolights/config/ConfigLoader.h"
#include "../../audiolights/config/SettingsRegistry.h"
#include "../../audiolights/hal/SteadyClock.h"
#include "../../audiolights/layout/LightLayout.h"
#include "../../audiolights/audio/AudioAnalyzer.h"
#include "../../audiolights/audio/AudioTask.h"
#include "../../audiolights/audio/SnapshotCell.h"
#include "../../audiolights/inputs/WavFileSource.h"
#include "../../audiolights/inputs/PipeSource.h"
#include "../../audiolights/inputs/ToneSource.h"
#include "../../audiolights/inputs/CommandConsole.h"
#include "../../audiolights/patterns/PatternEngine.h"
#include "../../audiolights/patterns/PatternType.h"
#include "../../audiolights/render/LightScheduler.h"
#include "../../audiolights/types/LightsAssert.h"

struct LinkConfig {
    std::string configPath = "";    // Empty: use audiolights.json if present
    std::string pattern = "";
    std::string audioFile = "";
    std::string audioCmd = "";
    std::string output = "";
    std::string layout = "";        // zone=count,zone=count
    std::vector<std::string> sets;  // --set name=value, applied in order
    float toneBpm = 0.0f;           // > 0 selects the test tone
    float durationSec = 0.0f;       // 0 = until interrupted
    bool demo = false;
    bool interactive = false;
    bool listPatterns = false;
    bool noConsole = false;
    bool verbose = false;
    bool showHelp = false;
};

// Default config file looked up in the working directory
const char* DEFAULT_CONFIG_FILE = "audiolights.json";

// Set from the signal handler; std::atomic<bool> is lock-free here
static std::atomic<bool> g_interrupted(false);
static LightScheduler* g_scheduler = nullptr;

static void onSignal(int) {
    g_interrupted = true;
    if (g_scheduler) g_scheduler->requestStop();
}

static void installSignalHandlers() {
    struct sigaction sa;
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A bridge that exits turns writes into EPIPE failures instead of killing us
    signal(SIGPIPE, SIG_IGN);
}

static bool fileExists(const char* path) {
    struct stat st;
    return stat(path, &st) == 0;
}

void printHelp() {
    std::cout << R"(
audiolights-link - audio-reactive point lights for a remote 3D host

USAGE:
    audiolights-link [OPTIONS]

OPTIONS:
    --config, -c <file>      JSON config (default: audiolights.json if present)
    --pattern, -p <name|n>   Starting pattern (default: chase, see --list-patterns)
    --demo                   No audio; audio patterns show their idle look
    --audio-file <wav>       Loop a WAV file as the audio input
    --audio-cmd <command>    Read s16le mono PCM from a capture command's stdout
    --tone <bpm>             Built-in kick/hat test signal
    --output, -o <file>      Host message stream ("-" = stdout, default)
    --layout <spec>          Light counts, e.g. left=5,right=5,front=3,back=2,top=4
    --set <name=value>       Override one setting (repeatable, see "settings" below)
    --interactive, -i        Prompt for light counts per zone
    --duration <seconds>     Stop after this long (default: run until Ctrl+C)
    --list-patterns          List patterns and exit
    --no-console             Do not read commands from stdin
    --verbose, -v            Verbose diagnostics on stderr
    --help, -h               Show this help message

CONSOLE COMMANDS (while running):
    pattern <name|n>, next, prev, list, status, get <name>, show [category], help, quit

EXAMPLES:
    # Test tone driving the bass flood pattern, messages on stdout
    audiolights-link --tone 120 -p bass_flood

    # Monitor system audio through PulseAudio
    audiolights-link --audio-cmd "parec --format=s16le --channels=1 --rate=44100"

    # Ten seconds of the chase pattern with a small layout, into a file
    audiolights-link --demo --layout left=4,right=4,top=2 --duration 10 -o lights.jsonl

EXIT STATUS:
    0 after a normal shutdown, 1 when startup fails (arguments, config, light creation)

)" << std::endl;
}

static bool needsValue(int i, int argc, const std::string& arg) {
    if (i + 1 < argc) return true;
    std::cerr << "Missing value for " << arg << std::endl;
    return false;
}

bool parseArgs(int argc, char* argv[], LinkConfig& config) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--demo") {
            config.demo = true;
        } else if (arg == "--interactive" || arg == "-i") {
            config.interactive = true;
        } else if (arg == "--list-patterns") {
            config.listPatterns = true;
        } else if (arg == "--no-console") {
            config.noConsole = true;
        } else if (arg == "--config" || arg == "-c") {
            if (!needsValue(i, argc, arg)) return false;
            config.configPath = argv[++i];
        } else if (arg == "--pattern" || arg == "-p") {
            if (!needsValue(i, argc, arg)) return false;
            config.pattern = argv[++i];
        } else if (arg == "--audio-file") {
            if (!needsValue(i, argc, arg)) return false;
            config.audioFile = argv[++i];
        } else if (arg == "--audio-cmd") {
            if (!needsValue(i, argc, arg)) return false;
            config.audioCmd = argv[++i];
        } else if (arg == "--tone") {
            if (!needsValue(i, argc, arg)) return false;
            config.toneBpm = (float)std::atof(argv[++i]);
            if (!(config.toneBpm > 0.0f)) {
                std::cerr << "--tone needs a positive BPM" << std::endl;
                return false;
            }
        } else if (arg == "--output" || arg == "-o") {
            if (!needsValue(i, argc, arg)) return false;
            config.output = argv[++i];
        } else if (arg == "--layout") {
            if (!needsValue(i, argc, arg)) return false;
            config.layout = argv[++i];
        } else if (arg == "--set") {
            if (!needsValue(i, argc, arg)) return false;
            config.sets.push_back(argv[++i]);
        } else if (arg == "--duration") {
            if (!needsValue(i, argc, arg)) return false;
            config.durationSec = (float)std::atof(argv[++i]);
            if (!(config.durationSec >= 0.0f)) {
                std::cerr << "--duration must not be negative" << std::endl;
                return false;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }

    int sources = (config.demo ? 1 : 0) + (config.audioFile.empty() ? 0 : 1) +
                  (config.audioCmd.empty() ? 0 : 1) + (config.toneBpm > 0.0f ? 1 : 0);
    if (sources > 1) {
        std::cerr << "Choose only one of --demo, --audio-file, --audio-cmd, --tone" << std::endl;
        return false;
    }
    return true;
}

void printPatterns() {
    std::cout << "Patterns:" << std::endl;
    for (int i = 0; i < PatternTypes::NUM_PATTERNS; i++) {
        PatternType type;
        if (!PatternTypes::fromIndex(i, type)) continue;
        std::cout << "  " << (i < 10 ? " " : "") << i << "  " << PatternTypes::name(type)
                  << (PatternTypes::isAudioDriven(type) ? "  (audio)" : "") << std::endl;
    }
}

// Prompt on the terminal for each zone's light count
bool promptLayout(LightsConfig& cfg) {
    std::cerr << "Enter number of lights per zone (blank keeps the current value):" << std::endl;
    for (int z = 0; z < NUM_ZONES; z++) {
        const char* zone = ZoneInfo::name(ZoneInfo::fromIndex(z));
        while (true) {
            std::cerr << "  " << zone << " [" << cfg.zoneCounts[z] << "]: " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                std::cerr << std::endl;
                return false;
            }
            if (line.empty()) break;

            char* end;
            long n = std::strtol(line.c_str(), &end, 10);
            if (*end == '\0' && n >= 0) {
                cfg.zoneCounts[z] = (int)n;
                break;
            }
            std::cerr << "  Please enter a whole number (0 to skip)" << std::endl;
        }
    }
    return true;
}

// Apply the command line on top of the loaded config
bool applyOverrides(const LinkConfig& link, LightsConfig& cfg, SettingsRegistry& settings) {
    if (!link.pattern.empty()) {
        PatternType type;
        if (!PatternTypes::parse(link.pattern.c_str(), type)) {
            std::cerr << "Unknown pattern: " << link.pattern << " (see --list-patterns)" << std::endl;
            return false;
        }
        cfg.defaultPattern = PatternTypes::name(type);
    }

    if (link.demo) {
        cfg.audio.kind = AudioSourceKind::NONE;
    } else if (!link.audioFile.empty()) {
        cfg.audio.kind = AudioSourceKind::FILE;
        cfg.audio.path = link.audioFile;
    } else if (!link.audioCmd.empty()) {
        cfg.audio.kind = AudioSourceKind::PIPE;
        cfg.audio.command = link.audioCmd;
    } else if (link.toneBpm > 0.0f) {
        cfg.audio.kind = AudioSourceKind::TONE;
        cfg.audio.toneBpm = link.toneBpm;
    }

    if (!link.output.empty()) {
        cfg.transport.output = link.output;
    }

    if (!link.layout.empty()) {
        Result r = ConfigLoader::applyLayoutSpec(link.layout.c_str(), cfg);
        if (!r) {
            std::cerr << "Configuration error: " << r.message << std::endl;
            return false;
        }
    }

    for (size_t i = 0; i < link.sets.size(); i++) {
        if (!settings.applyAssignment(link.sets[i].c_str())) {
            std::cerr << "Rejected --set " << link.sets[i] << std::endl;
            return false;
        }
    }

    if (link.interactive && !promptLayout(cfg)) {
        std::cerr << "Layout input ended early" << std::endl;
        return false;
    }
    return true;
}

// nullptr for demo mode
std::unique_ptr<IAudioSource> createSource(const LightsConfig& cfg, ISystemTime& clock) {
    float rate = cfg.analyzer.sampleRate;
    switch (cfg.audio.kind) {
        case AudioSourceKind::FILE:
            return std::unique_ptr<IAudioSource>(new WavFileSource(cfg.audio.path, rate, clock));
        case AudioSourceKind::PIPE:
            return std::unique_ptr<IAudioSource>(new PipeSource(cfg.audio.command, rate));
        case AudioSourceKind::TONE:
            return std::unique_ptr<IAudioSource>(new ToneSource(cfg.audio.toneBpm, rate, clock));
        case AudioSourceKind::NONE:
        default:
            return std::unique_ptr<IAudioSource>();
    }
}

std::string sessionTag() {
    char buf[24];
    snprintf(buf, sizeof(buf), "%08lx%04x", (unsigned long)std::time(nullptr),
             (unsigned)(getpid() & 0xFFFF));
    return buf;
}

int main(int argc, char* argv[]) {
    LinkConfig link;

    if (!parseArgs(argc, argv, link)) {
        std::cerr << "Use --help for usage information." << std::endl;
        return 1;
    }

    if (link.showHelp) {
        printHelp();
        return 0;
    }

    if (link.listPatterns) {
        printPatterns();
        return 0;
    }

    DebugLog::verbose = link.verbose;

    // Configuration: defaults -> file -> command line
    LightsConfig cfg;
    std::string configPath = link.configPath;
    if (configPath.empty() && fileExists(DEFAULT_CONFIG_FILE)) {
        configPath = DEFAULT_CONFIG_FILE;
    }
    if (!configPath.empty()) {
        Result r = ConfigLoader::loadFile(configPath.c_str(), cfg);
        if (!r) {
            std::cerr << "Configuration error: " << r.message << std::endl;
            return 1;
        }
    }

    SettingsRegistry settings(stderr);
    if (!ConfigLoader::registerSettings(settings, cfg)) {
        std::cerr << "Failed to register settings" << std::endl;
        return 1;
    }

    if (!applyOverrides(link, cfg, settings)) {
        return 1;
    }

    Result valid = cfg.validate();
    if (!valid) {
        std::cerr << "Configuration error: " << valid.message << std::endl;
        return 1;
    }

    // Threads start below; settings stay read-only from here on
    settings.lock();

    SteadyClock clock;
    LightLayout layout(cfg.zoneCounts, cfg.geometry);

    PatternEngine engine;
    if (!engine.begin(layout, cfg.patterns)) {
        std::cerr << "Failed to initialize pattern engine" << std::endl;
        return 1;
    }

    PatternType initialPattern = PatternType::CHASE;
    if (!PatternTypes::fromName(cfg.defaultPattern.c_str(), initialPattern)) {
        std::cerr << "Unknown pattern: " << cfg.defaultPattern << std::endl;
        return 1;
    }

    installSignalHandlers();

    JsonLineTransport transport(cfg.transport, sessionTag());
    if (!transport.open()) {
        return 1;
    }

    std::cerr << "Layout: " << layout.total() << " lights (L" << cfg.zoneCounts[0]
              << " R" << cfg.zoneCounts[1] << " F" << cfg.zoneCounts[2]
              << " B" << cfg.zoneCounts[3] << " T" << cfg.zoneCounts[4]
              << " Bo" << cfg.zoneCounts[5] << ")" << std::endl;
    std::cerr << "Pattern: " << PatternTypes::name(initialPattern) << std::endl;

    // Audio: any failure here degrades to the silence fallback
    SnapshotCell audioCell;
    AudioAnalyzer analyzer(clock);
    std::unique_ptr<IAudioSource> source = createSource(cfg, clock);
    std::unique_ptr<AudioTask> audioTask;

    if (!source) {
        std::cerr << "Audio: none (demo mode, audio patterns show their idle look)" << std::endl;
    } else if (!analyzer.begin(cfg.analyzer)) {
        DEBUG_WARN("Audio analyzer rejected its parameters; continuing without audio");
    } else {
        audioTask.reset(new AudioTask(*source, analyzer, audioCell, clock));
        if (audioTask->start()) {
            std::cerr << "Audio: " << LightsConfig::audioSourceName(cfg.audio.kind)
                      << " (" << source->describe() << ")" << std::endl;
        } else {
            DEBUG_WARN_F("Audio source %s failed to start; continuing without audio\n",
                         source->describe());
            audioTask.reset();
        }
    }

    LightScheduler scheduler(layout, engine, transport, audioCell, clock);
    g_scheduler = &scheduler;

    Result started = scheduler.begin(cfg.scheduler, initialPattern);
    if (!started) {
        std::cerr << "Failed to create lights: " << started.message << std::endl;
        std::cerr << "Is the host bridge reading the message stream?" << std::endl;
        g_scheduler = nullptr;
        if (audioTask) audioTask->stop();
        transport.close();
        return 1;
    }
    std::cerr << "Created " << layout.total() << " lights." << std::endl;

    CommandConsole console(scheduler, settings, stderr);
    if (!link.noConsole && !g_interrupted.load()) {
        if (!console.start(STDIN_FILENO)) {
            DEBUG_WARN("Continuing without console input");
        }
    }

    std::cerr << "Running at " << cfg.scheduler.updateRate << " Hz. Press Ctrl+C to stop." << std::endl;
    if (g_interrupted.load()) {
        scheduler.requestStop();
    }
    scheduler.run((uint32_t)(link.durationSec * 1000.0f));

    // Teardown: lights first (bounded), then inputs
    int removed = scheduler.shutdown();
    g_scheduler = nullptr;
    console.stop();
    if (audioTask) audioTask->stop();
    transport.close();

    SchedulerStats stats = scheduler.stats();
    std::cerr << "Stopped. Removed " << removed << "/" << stats.lightsCreated << " lights, "
              << stats.ticks << " ticks, " << stats.updatesSent << " updates sent";
    if (stats.updateFailures > 0) {
        std::cerr << ", " << stats.updateFailures << " failed";
    }
    std::cerr << "." << std::endl;

    if (LightsAssert::failCount.load() > 0) {
        DEBUG_WARN_F("%u internal assertion(s) failed during the session\n",
                     (unsigned)LightsAssert::failCount.load());
    }
    return 0;
}
