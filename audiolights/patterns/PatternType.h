#pragma once
#include <stdint.h>

/**
 * PatternType - Closed set of visual patterns
 *
 * Declaration order is the index order used by "pattern <n>", "next" and
 * "list". Time-driven patterns come first, audio-driven ones last.
 */
enum class PatternType : uint8_t {
    // Time-driven
    CHASE,
    CHASE_REVERSE,
    SWIRL,
    FRONT_TO_BACK,
    BACK_TO_FRONT,
    LEFT_OFF,
    RIGHT_OFF,
    LEFT_RIGHT_ALT,
    CENTER_OUT,
    ZONE_MIX,
    BREATHING,
    ALL_ON,

    // Audio-driven
    UPPER_BASS,
    BASS_FLOOD,
    TREBLE_HUE,
    BAND_SPLIT,
    MUSIC_COLOR,
    BEAT_HUE
};

namespace PatternTypes {
    constexpr int NUM_PATTERNS = 18;
    constexpr int FIRST_AUDIO_PATTERN = (int)PatternType::UPPER_BASS;

    // Canonical lowercase name, nullptr for out-of-range values
    const char* name(PatternType type);
    const char* nameByIndex(int index);

    // Case-insensitive; false for unknown names (out is untouched)
    bool fromName(const char* name, PatternType& out);
    bool fromIndex(int index, PatternType& out);

    // Accepts a name or a decimal index ("chase", "3")
    bool parse(const char* text, PatternType& out);

    inline int toIndex(PatternType type) { return (int)type; }

    inline bool isAudioDriven(PatternType type) {
        return (int)type >= FIRST_AUDIO_PATTERN;
    }

    // Wrapping neighbours in index order
    PatternType next(PatternType type);
    PatternType previous(PatternType type);
}
