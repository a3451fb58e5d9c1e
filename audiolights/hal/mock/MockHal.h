#pragma once
#include "../interfaces/ISystemTime.h"
#include "../interfaces/IAudioSource.h"
#include <vector>

/**
 * MockSystemTime - Test mock for system timing
 *
 * Allows tests to control time progression. delay() advances time
 * instantly so loops that sleep run at full speed.
 */
class MockSystemTime : public ISystemTime {
public:
    MockSystemTime() : currentMillis_(0), currentMicros_(0), delayCalls_(0) {}

    uint32_t millis() const override { return currentMillis_; }
    uint32_t micros() const override { return currentMicros_; }

    void delay(uint32_t ms) override {
        delayCalls_++;
        advanceMillis(ms);
    }

    // Test helpers
    void advanceMillis(uint32_t ms) {
        currentMillis_ += ms;
        currentMicros_ += ms * 1000;
    }

    void setMillis(uint32_t ms) {
        currentMillis_ = ms;
        currentMicros_ = ms * 1000;
    }

    uint32_t delayCalls() const { return delayCalls_; }

    void reset() {
        currentMillis_ = 0;
        currentMicros_ = 0;
        delayCalls_ = 0;
    }

private:
    uint32_t currentMillis_;
    uint32_t currentMicros_;
    uint32_t delayCalls_;
};

/**
 * MockAudioSource - Test mock for an audio stream
 *
 * Hands out queued samples in blocks, then reports "nothing yet" (0)
 * or a failure (-1) once failOnEmpty is set.
 */
class MockAudioSource : public IAudioSource {
public:
    explicit MockAudioSource(float rate = 44100.0f)
        : rate_(rate), readPos_(0), open_(false), failBegin(false), failOnEmpty(false),
          beginCalls_(0), endCalls_(0) {}

    bool begin() override {
        beginCalls_++;
        if (failBegin) return false;
        open_ = true;
        return true;
    }

    void end() override {
        endCalls_++;
        open_ = false;
    }

    int read(float* buffer, int maxSamples) override {
        if (!open_) return -1;
        int available = (int)samples_.size() - readPos_;
        if (available <= 0) {
            return failOnEmpty ? -1 : 0;
        }
        int n = available < maxSamples ? available : maxSamples;
        for (int i = 0; i < n; i++) {
            buffer[i] = samples_[readPos_ + i];
        }
        readPos_ += n;
        return n;
    }

    float sampleRate() const override { return rate_; }
    const char* describe() const override { return "mock"; }

    // Test helpers
    void queue(const float* samples, int count) {
        samples_.insert(samples_.end(), samples, samples + count);
    }

    void queueSilence(int count) {
        samples_.insert(samples_.end(), count, 0.0f);
    }

    int remaining() const { return (int)samples_.size() - readPos_; }
    bool isOpen() const { return open_; }
    int beginCalls() const { return beginCalls_; }
    int endCalls() const { return endCalls_; }

private:
    float rate_;
    std::vector<float> samples_;
    int readPos_;
    bool open_;

public:
    bool failBegin;
    bool failOnEmpty;

private:
    int beginCalls_;
    int endCalls_;
};
