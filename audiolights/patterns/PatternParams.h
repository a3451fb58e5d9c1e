#pragma once

/**
 * PatternParams - Timing and look tunables shared by all patterns
 */
struct PatternParams {
    // Chase
    int chaseTail;            // Lit lights including the head
    float chaseStep;          // Seconds per head step

    // Motion rates
    float swirlRate;          // Swirl revolutions per second
    float sweepRate;          // Front/back wave cycles per second
    float altPeriod;          // Seconds per left/right alternation
    float centerPeriod;       // Seconds for one center-out reveal
    float breathPeriod;       // Seconds per breath
    float zoneMixCycle;       // Seconds per zone_mix configuration

    // Audio-driven look
    float idleIntensity;      // Intensity of the idle look under silence

    PatternParams() {
        chaseTail = 3;
        chaseStep = 0.1f;
        swirlRate = 0.25f;
        sweepRate = 0.5f;
        altPeriod = 1.0f;
        centerPeriod = 2.0f;
        breathPeriod = 4.0f;
        zoneMixCycle = 14.0f;
        idleIntensity = 0.15f;
    }
};
