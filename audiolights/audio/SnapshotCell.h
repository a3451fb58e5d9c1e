#pragma once

#include "AudioSnapshot.h"
#include <atomic>
#include <mutex>
#include <stdint.h>

/**
 * SnapshotCell - Single-writer, multi-reader slot holding the latest snapshot
 *
 * The audio task publishes, the scheduler reads. The lock only guards a
 * struct copy, so neither side waits on the other's work. Readers never
 * wait for a new value: they get whatever was published last.
 */
class SnapshotCell {
public:
    SnapshotCell() : hasValue_(false), version_(0) {}

    void publish(const AudioSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = snapshot;
        hasValue_ = true;
        version_++;
    }

    AudioSnapshot read() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    /**
     * Latest snapshot, or silence when nothing was published yet or the
     * last publish is older than maxAgeMs. The beat count survives so a
     * reader tracking pulses doesn't see it jump back to zero.
     * A snapshot stamped after nowMs (published between the reader taking
     * its time and taking the lock) counts as fresh.
     */
    AudioSnapshot readFresh(uint32_t nowMs, uint32_t maxAgeMs) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!hasValue_) {
            return AudioSnapshot::silence(nowMs);
        }
        int32_t age = (int32_t)(nowMs - value_.timestampMs);
        if (age > 0 && (uint32_t)age > maxAgeMs) {
            return AudioSnapshot::silence(nowMs, value_.beatCount);
        }
        return value_;
    }

    uint32_t version() const { return version_.load(); }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = AudioSnapshot();
        hasValue_ = false;
    }

private:
    mutable std::mutex mutex_;
    AudioSnapshot value_;
    bool hasValue_;
    std::atomic<uint32_t> version_;

    // Prevent copying
    SnapshotCell(const SnapshotCell&) = delete;
    SnapshotCell& operator=(const SnapshotCell&) = delete;
};
