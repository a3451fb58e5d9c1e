#pragma once

#include "../layout/Zone.h"
#include "../layout/LightLayout.h"
#include "../patterns/PatternParams.h"
#include "../audio/AudioAnalyzer.h"
#include "../render/LightScheduler.h"
#include "../types/Result.h"
#include <string>

enum class AudioSourceKind : uint8_t {
    NONE,    // Demo mode: silence snapshot only
    FILE,    // Looping WAV file
    PIPE,    // External capture command writing s16le mono
    TONE     // Synthetic test loop
};

struct AudioSourceConfig {
    AudioSourceKind kind = AudioSourceKind::NONE;
    std::string path;          // FILE
    std::string command;       // PIPE
    float toneBpm = 120.0f;    // TONE
};

struct TransportConfig {
    std::string output = "-";            // "-" = stdout, otherwise a file path
    std::string parentSlotId = "Root";   // Host slot the light root is parented to
    float intensityScale = 2.0f;         // Host-side intensity = frame intensity * scale
    float lightRange = 10.0f;            // Point light range in host units
};

/**
 * LightsConfig - Complete runtime configuration with documented defaults
 *
 * Every field has a usable default; the program runs with no config file.
 * Loaders write into this struct, then validate() decides whether it is
 * safe to start.
 */
struct LightsConfig {
    int zoneCounts[NUM_ZONES];      // left, right, front, back, top, bottom
    LayoutGeometry geometry;
    std::string defaultPattern;

    PatternParams patterns;
    AnalyzerParams analyzer;
    SchedulerParams scheduler;
    AudioSourceConfig audio;
    TransportConfig transport;

    LightsConfig();

    // CONFIGURATION failure naming the first bad field
    Result validate() const;

    int totalLights() const;

    static const char* audioSourceName(AudioSourceKind kind);
    static bool audioSourceFromName(const char* name, AudioSourceKind& out);
};
