#pragma once

#include "AudioAnalyzer.h"
#include "SnapshotCell.h"
#include "../hal/interfaces/IAudioSource.h"
#include "../hal/interfaces/ISystemTime.h"
#include <atomic>
#include <thread>
#include <vector>

/**
 * AudioTask - Analysis cadence: source -> analyzer -> snapshot cell
 *
 * Runs on its own thread so audio analysis never stalls the light loop.
 * A source failure while running is logged once and the task stops;
 * the scheduler then sees stale snapshots and falls back to silence.
 *
 * Usage:
 *   AudioTask task(source, analyzer, cell, clock);
 *   if (!task.start()) { ... startup failure ... }
 *   ...
 *   task.stop();
 */
class AudioTask {
public:
    static constexpr int DEFAULT_BLOCK_SIZE = 512;

    AudioTask(IAudioSource& source, AudioAnalyzer& analyzer,
              SnapshotCell& cell, ISystemTime& time,
              int blockSize = DEFAULT_BLOCK_SIZE);
    ~AudioTask();

    // Opens the source and spawns the thread; false if the source won't open
    bool start();

    // Signals the thread, joins it and closes the source. Safe to call twice.
    void stop();

    /**
     * One iteration of the loop body: read, analyze, publish, check timeout.
     * @return samples read, 0 when idle, -1 when the source failed
     */
    int pollOnce();

    bool isRunning() const { return running_.load(); }
    bool hasFailed() const { return failed_.load(); }

    // Idle wait between empty reads (ms)
    uint32_t idleDelayMs;

private:
    void threadMain();

    IAudioSource& source_;
    AudioAnalyzer& analyzer_;
    SnapshotCell& cell_;
    ISystemTime& time_;

    std::vector<float> block_;
    std::thread thread_;
    std::atomic<bool> stopRequested_;
    std::atomic<bool> running_;
    std::atomic<bool> failed_;
    bool sourceOpen_;

    // Prevent copying
    AudioTask(const AudioTask&) = delete;
    AudioTask& operator=(const AudioTask&) = delete;
};
