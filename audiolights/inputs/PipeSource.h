#pragma once

#include "../hal/interfaces/IAudioSource.h"
#include <stdio.h>
#include <string>
#include <vector>

/**
 * PipeSource - Reads raw PCM from an external capture command
 *
 * The command must write signed 16-bit little-endian mono samples to
 * stdout at the configured rate, e.g.
 *   parec --format=s16le --channels=1 --rate=44100
 *   ffmpeg -f pulse -i default -f s16le -ac 1 -ar 44100 -
 *
 * The command's own pace drives the stream. EOF or a read error is a
 * source failure.
 */
class PipeSource : public IAudioSource {
public:
    PipeSource(const std::string& command, float sampleRate);
    ~PipeSource();

    bool begin() override;
    void end() override;
    int read(float* buffer, int maxSamples) override;
    float sampleRate() const override { return sampleRate_; }
    const char* describe() const override { return description_.c_str(); }

private:
    std::string command_;
    std::string description_;
    float sampleRate_;
    FILE* pipe_;
    std::vector<int16_t> raw_;

    // Prevent copying
    PipeSource(const PipeSource&) = delete;
    PipeSource& operator=(const PipeSource&) = delete;
};
