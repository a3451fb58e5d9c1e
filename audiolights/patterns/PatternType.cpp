#include "PatternType.h"
#include <stdlib.h>
#include <strings.h>

namespace {
    const char* const PATTERN_NAMES[PatternTypes::NUM_PATTERNS] = {
        "chase",
        "chase_reverse",
        "swirl",
        "front_to_back",
        "back_to_front",
        "left_off",
        "right_off",
        "left_right_alt",
        "center_out",
        "zone_mix",
        "breathing",
        "all_on",
        "upper_bass",
        "bass_flood",
        "treble_hue",
        "band_split",
        "music_color",
        "beat_hue"
    };
}

namespace PatternTypes {

const char* nameByIndex(int index) {
    if (index < 0 || index >= NUM_PATTERNS) return nullptr;
    return PATTERN_NAMES[index];
}

const char* name(PatternType type) {
    return nameByIndex((int)type);
}

bool fromIndex(int index, PatternType& out) {
    if (index < 0 || index >= NUM_PATTERNS) return false;
    out = (PatternType)index;
    return true;
}

bool fromName(const char* text, PatternType& out) {
    if (!text) return false;
    for (int i = 0; i < NUM_PATTERNS; i++) {
        if (strcasecmp(text, PATTERN_NAMES[i]) == 0) {
            out = (PatternType)i;
            return true;
        }
    }
    return false;
}

bool parse(const char* text, PatternType& out) {
    if (!text || !*text) return false;
    if (fromName(text, out)) return true;

    char* end;
    long index = strtol(text, &end, 10);
    if (end == text || *end != '\0') return false;
    return fromIndex((int)index, out);
}

PatternType next(PatternType type) {
    return (PatternType)(((int)type + 1) % NUM_PATTERNS);
}

PatternType previous(PatternType type) {
    return (PatternType)(((int)type + NUM_PATTERNS - 1) % NUM_PATTERNS);
}

}
