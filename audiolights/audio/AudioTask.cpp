#include "AudioTask.h"
#include "../config/DebugLog.h"

AudioTask::AudioTask(IAudioSource& source, AudioAnalyzer& analyzer,
                     SnapshotCell& cell, ISystemTime& time, int blockSize)
    : idleDelayMs(2)
    , source_(source)
    , analyzer_(analyzer)
    , cell_(cell)
    , time_(time)
    , block_(blockSize > 0 ? blockSize : DEFAULT_BLOCK_SIZE, 0.0f)
    , stopRequested_(false)
    , running_(false)
    , failed_(false)
    , sourceOpen_(false)
{
}

AudioTask::~AudioTask() {
    stop();
}

bool AudioTask::start() {
    if (running_.load()) return true;

    if (!source_.begin()) {
        DEBUG_ERROR_F("Audio source failed to open: %s\n", source_.describe());
        return false;
    }
    sourceOpen_ = true;
    DEBUG_INFO_F("Audio source: %s\n", source_.describe());

    stopRequested_ = false;
    failed_ = false;
    running_ = true;
    thread_ = std::thread(&AudioTask::threadMain, this);
    return true;
}

void AudioTask::stop() {
    stopRequested_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    if (sourceOpen_) {
        source_.end();
        sourceOpen_ = false;
    }
}

int AudioTask::pollOnce() {
    int n = source_.read(block_.data(), (int)block_.size());
    if (n < 0) {
        return -1;
    }
    if (n > 0 && analyzer_.addSamples(block_.data(), n) > 0) {
        cell_.publish(analyzer_.latest());
    }
    if (analyzer_.checkTimeout()) {
        cell_.publish(analyzer_.latest());
    }
    return n;
}

void AudioTask::threadMain() {
    while (!stopRequested_.load()) {
        int n = pollOnce();
        if (n < 0) {
            DEBUG_ERROR_F("Audio source failed while running: %s\n", source_.describe());
            failed_ = true;
            cell_.publish(AudioSnapshot::silence(time_.millis(), analyzer_.latest().beatCount));
            break;
        }
        if (n == 0) {
            time_.delay(idleDelayMs);
        }
    }
    running_ = false;
}
