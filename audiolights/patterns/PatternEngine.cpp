#include "PatternEngine.h"
#include "ChasePattern.h"
#include "SweepPatterns.h"
#include "ZonePatterns.h"
#include "AmbientPatterns.h"
#include "AudioPatterns.h"
#include "../types/LightsAssert.h"
#include "../config/DebugLog.h"
#include <new>

PatternEngine::PatternEngine()
    : current_(nullptr), type_(PatternType::CHASE), activatedAt_(0.0f),
      layout_(nullptr), initialized_(false) {
    for (int i = 0; i < PatternTypes::NUM_PATTERNS; i++) {
        patterns_[i] = nullptr;
    }
}

PatternEngine::~PatternEngine() {
    releasePatterns();
}

void PatternEngine::releasePatterns() {
    for (int i = 0; i < PatternTypes::NUM_PATTERNS; i++) {
        delete patterns_[i];
        patterns_[i] = nullptr;
    }
    current_ = nullptr;
}

bool PatternEngine::begin(const LightLayout& layout, const PatternParams& params) {
    if (initialized_) {
        DEBUG_WARN("Pattern engine already initialized");
        return false;
    }
    // Leftovers from a begin() that failed part way
    releasePatterns();
    layout_ = &layout;

    // Index order must match PatternType
    patterns_[(int)PatternType::CHASE] = new(std::nothrow) ChasePattern(false);
    patterns_[(int)PatternType::CHASE_REVERSE] = new(std::nothrow) ChasePattern(true);
    patterns_[(int)PatternType::SWIRL] = new(std::nothrow) SwirlPattern();
    patterns_[(int)PatternType::FRONT_TO_BACK] = new(std::nothrow) WavePattern(false);
    patterns_[(int)PatternType::BACK_TO_FRONT] = new(std::nothrow) WavePattern(true);
    patterns_[(int)PatternType::LEFT_OFF] = new(std::nothrow) ZoneOffPattern(Zone::LEFT);
    patterns_[(int)PatternType::RIGHT_OFF] = new(std::nothrow) ZoneOffPattern(Zone::RIGHT);
    patterns_[(int)PatternType::LEFT_RIGHT_ALT] = new(std::nothrow) LeftRightAltPattern();
    patterns_[(int)PatternType::CENTER_OUT] = new(std::nothrow) CenterOutPattern();
    patterns_[(int)PatternType::ZONE_MIX] = new(std::nothrow) ZoneMixPattern();
    patterns_[(int)PatternType::BREATHING] = new(std::nothrow) BreathingPattern();
    patterns_[(int)PatternType::ALL_ON] = new(std::nothrow) AllOnPattern();
    patterns_[(int)PatternType::UPPER_BASS] = new(std::nothrow) UpperBassPattern();
    patterns_[(int)PatternType::BASS_FLOOD] = new(std::nothrow) BassFloodPattern();
    patterns_[(int)PatternType::TREBLE_HUE] = new(std::nothrow) TrebleHuePattern();
    patterns_[(int)PatternType::BAND_SPLIT] = new(std::nothrow) BandSplitPattern();
    patterns_[(int)PatternType::MUSIC_COLOR] = new(std::nothrow) MusicColorPattern();
    patterns_[(int)PatternType::BEAT_HUE] = new(std::nothrow) BeatHuePattern();

    for (int i = 0; i < PatternTypes::NUM_PATTERNS; i++) {
        if (!patterns_[i] || !patterns_[i]->begin(layout, params)) {
            return false;
        }
        LIGHTS_ASSERT((int)patterns_[i]->getType() == i, "Pattern table out of order");
        patterns_[i]->reset();
    }

    current_ = patterns_[(int)PatternType::CHASE];
    type_ = PatternType::CHASE;
    activatedAt_ = 0.0f;
    initialized_ = true;
    return true;
}

bool PatternEngine::setPattern(PatternType type, float sessionSeconds) {
    if (!initialized_) return false;

    Pattern* next = getPattern(type);
    if (!next) return false;

    // Reset new pattern to clean state
    next->reset();
    current_ = next;
    type_ = type;
    activatedAt_ = sessionSeconds;
    return true;
}

Pattern* PatternEngine::getPattern(PatternType type) {
    int index = (int)type;
    if (index < 0 || index >= PatternTypes::NUM_PATTERNS) return nullptr;
    return patterns_[index];
}

const char* PatternEngine::getPatternName() const {
    if (current_) {
        return current_->getName();
    }
    return "none";
}

float PatternEngine::localTime(float sessionSeconds) const {
    float t = sessionSeconds - activatedAt_;
    return t > 0.0f ? t : 0.0f;
}

void PatternEngine::step(const AudioSnapshot& audio, float sessionSeconds, LightFrameBuffer& out) {
    if (!initialized_ || !current_ || !layout_) {
        return;
    }
    if (out.size() != layout_->total()) {
        out.resize(layout_->total());
    }
    current_->step(audio, localTime(sessionSeconds), out);
}
