#pragma once

#include "Pattern.h"
#include "PatternType.h"
#include "PatternParams.h"
#include "../layout/LightLayout.h"
#include "../render/LightFrame.h"
#include "../audio/AudioSnapshot.h"

/**
 * PatternEngine - Owns every pattern and runs the active one
 *
 * Enforces exactly one active pattern at all times. Activating a pattern
 * resets its state and restarts its local clock, so switching away and
 * back never resumes from stale state.
 *
 * Usage:
 *   PatternEngine engine;
 *   engine.begin(layout, params);
 *   engine.setPattern(PatternType::ZONE_MIX, sessionSeconds);
 *   engine.step(snapshot, sessionSeconds, frames);
 */
class PatternEngine {
public:
    PatternEngine();
    ~PatternEngine();

    // Both references must outlive the engine
    bool begin(const LightLayout& layout, const PatternParams& params);

    /**
     * Make `type` the active pattern, starting its local time at
     * sessionSeconds. Re-selecting the active pattern restarts it too.
     */
    bool setPattern(PatternType type, float sessionSeconds);

    // Evaluate the active pattern; out is resized to the layout
    void step(const AudioSnapshot& audio, float sessionSeconds, LightFrameBuffer& out);

    PatternType getPatternType() const { return type_; }
    const char* getPatternName() const;
    Pattern* getPattern(PatternType type);
    Pattern* getCurrentPattern() { return current_; }

    // Local time of the active pattern at sessionSeconds
    float localTime(float sessionSeconds) const;

    bool isValid() const { return initialized_; }

private:
    Pattern* patterns_[PatternTypes::NUM_PATTERNS];
    Pattern* current_;
    PatternType type_;
    float activatedAt_;
    const LightLayout* layout_;
    bool initialized_;

    void releasePatterns();

    // Prevent copying
    PatternEngine(const PatternEngine&) = delete;
    PatternEngine& operator=(const PatternEngine&) = delete;
};
