#pragma once
#include "PatternType.h"
#include "PatternParams.h"
#include "../layout/LightLayout.h"
#include "../render/LightFrame.h"
#include "../audio/AudioSnapshot.h"

/**
 * Pattern - Base class for visual patterns
 *
 * A pattern maps (layout, audio snapshot, pattern-local time) to one
 * LightFrame per light. Pattern-local time starts at zero when the pattern
 * is activated. Any memory a pattern keeps between steps lives in the
 * subclass and is cleared by reset().
 *
 * Architecture flow:
 * AudioAnalyzer -> SnapshotCell -> PatternEngine -> Pattern -> LightScheduler
 */
class Pattern {
public:
    virtual ~Pattern() = default;

    /**
     * Bind to a layout and params. Subclasses precompute per-layout data
     * here; both references must outlive the pattern.
     */
    virtual bool begin(const LightLayout& layout, const PatternParams& params) {
        layout_ = &layout;
        params_ = &params;
        return true;
    }

    /**
     * Produce the frame for time t (seconds since activation)
     * @param out Sized to layout.total() by the caller
     */
    virtual void step(const AudioSnapshot& audio, float t, LightFrameBuffer& out) = 0;

    /**
     * Drop all pattern-local state
     */
    virtual void reset() = 0;

    virtual PatternType getType() const = 0;

    const char* getName() const { return PatternTypes::name(getType()); }

protected:
    const LightLayout* layout_ = nullptr;
    const PatternParams* params_ = nullptr;
};
