#pragma once
#include <stdint.h>

/**
 * IAudioSource - Abstract interface for a mono PCM sample stream
 *
 * Samples are floats in [-1, 1]. Implementations mix down to mono and
 * deliver at sampleRate(). read() may block for at most a few
 * milliseconds so the audio task can observe a stop request.
 */
class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    // Lifecycle
    virtual bool begin() = 0;
    virtual void end() = 0;

    /**
     * Read up to maxSamples samples.
     * @return samples written, 0 when nothing is available yet, -1 on failure
     */
    virtual int read(float* buffer, int maxSamples) = 0;

    virtual float sampleRate() const = 0;

    // Short human readable description for logs
    virtual const char* describe() const = 0;
};
