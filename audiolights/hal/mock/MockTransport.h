#pragma once
#include "../interfaces/ILightTransport.h"
#include "MockHal.h"
#include <vector>

/**
 * MockTransport - Records every light command for verification
 *
 * Failures can be injected per operation. When a clock is attached every
 * call costs callCostMs of mock time, which lets tests model a slow or
 * unreachable host.
 */
class MockTransport : public ILightTransport {
public:
    struct Update {
        LightHandle handle;
        LightFrame frame;
    };

    MockTransport() { reset(); }

    bool createLight(const LightDescriptor& light, const Vec3& position,
                     LightHandle& handleOut) override {
        charge();
        createCalls_++;
        if (failCreateForIndex == light.globalIndex || failAllCreates) {
            return false;
        }
        handleOut = nextHandle_++;
        created_.push_back(handleOut);
        positions_.push_back(position);
        live_.push_back(handleOut);
        return true;
    }

    bool updateLight(LightHandle handle, const LightFrame& frame) override {
        charge();
        if (failAllUpdates) {
            failedUpdates_++;
            return false;
        }
        Update u;
        u.handle = handle;
        u.frame = frame;
        updates_.push_back(u);
        return true;
    }

    bool removeLight(LightHandle handle) override {
        charge();
        removeCalls_++;
        if (failAllRemoves) {
            return false;
        }
        removed_.push_back(handle);
        for (size_t i = 0; i < live_.size(); i++) {
            if (live_[i] == handle) {
                live_.erase(live_.begin() + i);
                break;
            }
        }
        return true;
    }

    // Test helpers
    void attachClock(MockSystemTime* clock, uint32_t costMs) {
        clock_ = clock;
        callCostMs_ = costMs;
    }

    const std::vector<LightHandle>& created() const { return created_; }
    const std::vector<Vec3>& positions() const { return positions_; }
    const std::vector<Update>& updates() const { return updates_; }
    const std::vector<LightHandle>& removed() const { return removed_; }
    int liveCount() const { return (int)live_.size(); }
    int createCalls() const { return createCalls_; }
    int removeCalls() const { return removeCalls_; }
    int failedUpdates() const { return failedUpdates_; }

    void clearUpdates() { updates_.clear(); }

    void reset() {
        created_.clear();
        positions_.clear();
        updates_.clear();
        removed_.clear();
        live_.clear();
        nextHandle_ = 100;
        createCalls_ = 0;
        removeCalls_ = 0;
        failedUpdates_ = 0;
        failCreateForIndex = -1;
        failAllCreates = false;
        failAllUpdates = false;
        failAllRemoves = false;
        clock_ = nullptr;
        callCostMs_ = 0;
    }

    // Failure injection
    int failCreateForIndex;
    bool failAllCreates;
    bool failAllUpdates;
    bool failAllRemoves;

private:
    void charge() {
        if (clock_) clock_->advanceMillis(callCostMs_);
    }

    std::vector<LightHandle> created_;
    std::vector<Vec3> positions_;
    std::vector<Update> updates_;
    std::vector<LightHandle> removed_;
    std::vector<LightHandle> live_;
    LightHandle nextHandle_;
    int createCalls_;
    int removeCalls_;
    int failedUpdates_;
    MockSystemTime* clock_;
    uint32_t callCostMs_;
};
