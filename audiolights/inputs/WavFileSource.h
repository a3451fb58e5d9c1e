#pragma once

#include "../hal/interfaces/IAudioSource.h"
#include "../hal/interfaces/ISystemTime.h"
#include <stdint.h>
#include <string>
#include <vector>

/**
 * WavFileSource - Loops a RIFF/WAVE file as a live mono stream
 *
 * Supports PCM 16-bit and IEEE float 32-bit (plain or EXTENSIBLE header),
 * any channel count. Channels are averaged to mono and the result is
 * linearly resampled to the requested rate. Playback wraps to the start on
 * exhaustion so the analyzer never runs dry.
 *
 * When paced, read() only hands out as many samples as wall time allows,
 * so a file behaves like a live capture.
 */
class WavFileSource : public IAudioSource {
public:
    WavFileSource(const std::string& path, float targetRate, ISystemTime& time, bool paced = true);

    bool begin() override;
    void end() override;
    int read(float* buffer, int maxSamples) override;
    float sampleRate() const override { return outputRate_; }
    const char* describe() const override { return description_.c_str(); }

    // Number of times playback wrapped around
    uint32_t loopCount() const { return loops_; }
    int totalSamples() const { return (int)samples_.size(); }
    float fileSampleRate() const { return fileRate_; }
    int fileChannels() const { return channels_; }

    // Parse an in-memory WAV image; used by begin() and by tests
    bool parse(const std::vector<uint8_t>& bytes);

private:
    static uint16_t readU16(const uint8_t* p) { return (uint16_t)(p[0] | (p[1] << 8)); }
    static uint32_t readU32(const uint8_t* p) {
        return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
    }

    // Portable isfinite check
    static bool safeIsFinite(float x) {
        return (x == x) && (x >= -3.4e38f) && (x <= 3.4e38f);
    }

    void resampleTo(float rate);

    std::string path_;
    std::string description_;
    ISystemTime& time_;
    bool paced_;

    std::vector<float> samples_;     // Mono, at outputRate_
    float targetRate_;
    float outputRate_;
    float fileRate_;
    int channels_;
    size_t position_;
    uint32_t loops_;

    // Pacing
    uint32_t startMs_;
    uint64_t delivered_;
    bool open_;
};
