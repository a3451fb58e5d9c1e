#pragma once
/**
 * JsonLineTransport - ILightTransport that writes host messages as JSON lines
 *
 * Each call becomes one ResoniteLink-style message ("addSlot",
 * "addComponent", "updateComponent", "updateSlot", "removeSlot") written
 * as a single line to stdout or a file. A WebSocket bridge can forward the
 * stream to the host unchanged.
 *
 * Hierarchy on the host:
 *   <parent> -> "Audio Lights" root slot -> one slot per light with a PointLight
 *
 * The root is created with the first light and removed by close().
 * Only the scheduler thread may call the ILightTransport methods.
 *
 * Writes never block: the output descriptor is switched to O_NONBLOCK, and
 * a message the pipe cannot take right now is dropped and reported as a
 * failed send. A line the pipe accepts only in part is finished before the
 * next message goes out, so the stream always stays line-aligned.
 */

#include <ArduinoJson.h>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <unistd.h>
#include <vector>

#include "../../audiolights/hal/interfaces/ILightTransport.h"
#include "../../audiolights/config/LightsConfig.h"
#include "../../audiolights/config/DebugLog.h"
#include "../../audiolights/patterns/ColorMath.h"

namespace LinkIds {
    constexpr const char* ID_PREFIX = "RALC_";
    constexpr const char* LIGHT_COMPONENT = "[FrooxEngine]FrooxEngine.PointLight";
    constexpr const char* SPACE_COMPONENT = "[FrooxEngine]FrooxEngine.DynamicVariableSpace";
}

class JsonLineTransport : public ILightTransport {
public:

    /**
     * @param config Output target, parent slot, intensity scale, range
     * @param sessionTag Makes host ids unique per run (e.g. a hex timestamp)
     */
    JsonLineTransport(const TransportConfig& config, const std::string& sessionTag)
        : config_(config), tag_(sessionTag), fd_(-1), ownsFd_(false), savedFlags_(-1),
          rootCreated_(false), messages_(0), writeErrors_(0), dropped_(0) {}

    ~JsonLineTransport() override { close(); }

    /**
     * Open the configured output ("-" is stdout)
     * @return false if the file cannot be created
     */
    bool open() {
        if (fd_ >= 0) return true;
        if (config_.output.empty() || config_.output == "-") {
            return attachFd(STDOUT_FILENO, false);
        }
        // Opened blocking so a FIFO waits for its reader; writes are non-blocking
        int fd = ::open(config_.output.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            DEBUG_ERROR_F("Cannot open transport output: %s (%s)\n",
                          config_.output.c_str(), strerror(errno));
            return false;
        }
        if (!attachFd(fd, true)) {
            ::close(fd);
            return false;
        }
        return true;
    }

    // Write to a caller-owned descriptor instead of the configured output
    bool attach(int fd) {
        return attachFd(fd, false);
    }

    /**
     * Remove the root slot (and with it anything left under it), then
     * release the output. Safe to call more than once.
     */
    void close() {
        if (fd_ < 0) return;
        if (rootCreated_) {
            StaticJsonDocument<256> doc;
            doc["$type"] = "removeSlot";
            doc["slotId"] = rootId();
            if (!writeMessage(doc)) {
                DEBUG_WARN("Root slot removal could not be sent");
            }
            rootCreated_ = false;
        }
        if (!flushPending()) {
            DEBUG_WARN_F("Dropping %u bytes of an unfinished message\n", (unsigned)pending_.size());
        }
        pending_.clear();
        if (savedFlags_ >= 0) {
            fcntl(fd_, F_SETFL, savedFlags_);
        }
        if (ownsFd_) ::close(fd_);
        fd_ = -1;
        ownsFd_ = false;
        savedFlags_ = -1;
    }

    bool createLight(const LightDescriptor& light, const Vec3& position,
                     LightHandle& handleOut) override {
        if (fd_ < 0) return false;
        if (!rootCreated_ && !createRoot()) return false;

        Entry entry;
        entry.slotId = std::string(LinkIds::ID_PREFIX) + "Light_" + std::to_string(light.globalIndex) + "_" + tag_;
        entry.componentId = std::string(LinkIds::ID_PREFIX) + "Comp_" + std::to_string(light.globalIndex) + "_" + tag_;

        StaticJsonDocument<768> slot;
        slot["$type"] = "addSlot";
        JsonObject data = slot.createNestedObject("data");
        data["id"] = entry.slotId;
        setReference(data.createNestedObject("parent"), rootId());
        setString(data.createNestedObject("name"),
                  std::string("Light_") + ZoneInfo::name(light.zone) + "_" + std::to_string(light.zoneIndex));
        setFloat3(data.createNestedObject("position"), position.x, position.y, position.z);
        if (!writeMessage(slot)) return false;

        StaticJsonDocument<768> comp;
        comp["$type"] = "addComponent";
        comp["containerSlotId"] = entry.slotId;
        JsonObject cdata = comp.createNestedObject("data");
        cdata["id"] = entry.componentId;
        cdata["componentType"] = LinkIds::LIGHT_COMPONENT;
        JsonObject members = cdata.createNestedObject("members");
        setFloat3(members.createNestedObject("Color"), ColorMath::WARM_BASE.r, ColorMath::WARM_BASE.g, ColorMath::WARM_BASE.b);
        setFloat(members.createNestedObject("Intensity"), 0.0f);
        setFloat(members.createNestedObject("Range"), config_.lightRange);
        if (!writeMessage(comp)) return false;

        entries_.push_back(entry);
        handleOut = (LightHandle)(entries_.size() - 1);
        return true;
    }

    bool updateLight(LightHandle handle, const LightFrame& frame) override {
        Entry* entry = find(handle);
        if (fd_ < 0 || !entry) return false;

        StaticJsonDocument<512> doc;
        doc["$type"] = "updateComponent";
        JsonObject data = doc.createNestedObject("data");
        data["id"] = entry->componentId;
        JsonObject members = data.createNestedObject("members");
        setFloat3(members.createNestedObject("Color"), frame.color.r, frame.color.g, frame.color.b);
        setFloat(members.createNestedObject("Intensity"), frame.intensity * config_.intensityScale);
        if (!writeMessage(doc)) return false;

        if (frame.hasRotation) {
            // Yaw about the vertical axis as a unit quaternion
            float half = frame.yawDegrees * 0.5f * 3.14159265f / 180.0f;
            StaticJsonDocument<512> rot;
            rot["$type"] = "updateSlot";
            JsonObject rdata = rot.createNestedObject("data");
            rdata["id"] = entry->slotId;
            JsonObject q = rdata.createNestedObject("rotation");
            q["$type"] = "floatQ";
            JsonObject v = q.createNestedObject("value");
            v["x"] = 0.0f;
            v["y"] = std::sin(half);
            v["z"] = 0.0f;
            v["w"] = std::cos(half);
            if (!writeMessage(rot)) return false;
        }
        return true;
    }

    bool removeLight(LightHandle handle) override {
        Entry* entry = find(handle);
        if (fd_ < 0 || !entry) return false;

        StaticJsonDocument<256> doc;
        doc["$type"] = "removeSlot";
        doc["slotId"] = entry->slotId;
        if (!writeMessage(doc)) return false;
        entry->removed = true;
        return true;
    }

    std::string rootId() const { return std::string(LinkIds::ID_PREFIX) + "Root_" + tag_; }
    uint32_t messagesWritten() const { return messages_; }
    uint32_t writeErrors() const { return writeErrors_; }
    uint32_t droppedMessages() const { return dropped_; }
    bool isOpen() const { return fd_ >= 0; }

private:
    struct Entry {
        std::string slotId;
        std::string componentId;
        bool removed = false;
    };

    TransportConfig config_;
    std::string tag_;
    int fd_;
    bool ownsFd_;
    int savedFlags_;
    bool rootCreated_;
    std::vector<Entry> entries_;
    std::string pending_;
    uint32_t messages_;
    uint32_t writeErrors_;
    uint32_t dropped_;

    bool attachFd(int fd, bool owns) {
        if (fd < 0) return false;
        int flags = fcntl(fd, F_GETFL);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            DEBUG_ERROR_F("Cannot make transport output non-blocking (%s)\n", strerror(errno));
            return false;
        }
        fd_ = fd;
        ownsFd_ = owns;
        // Restore the caller's mode on close (stdout is shared with the shell)
        savedFlags_ = owns ? -1 : flags;
        return true;
    }

    // Write as much of data as the descriptor takes now; -1 on a hard error
    ssize_t writeSome(const char* data, size_t size) {
        ssize_t n;
        do {
            n = ::write(fd_, data, size);
        } while (n < 0 && errno == EINTR);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;
        return n;
    }

    // Finish a partially written line; false while some of it is still queued
    bool flushPending() {
        if (pending_.empty()) return true;
        ssize_t n = writeSome(pending_.data(), pending_.size());
        if (n < 0) {
            pending_.clear();
            return false;
        }
        pending_.erase(0, (size_t)n);
        return pending_.empty();
    }

    Entry* find(LightHandle handle) {
        if (handle < 0 || handle >= (LightHandle)entries_.size()) return nullptr;
        Entry* e = &entries_[handle];
        return e->removed ? nullptr : e;
    }

    bool createRoot() {
        StaticJsonDocument<512> slot;
        slot["$type"] = "addSlot";
        JsonObject data = slot.createNestedObject("data");
        data["id"] = rootId();
        setReference(data.createNestedObject("parent"), config_.parentSlotId);
        setString(data.createNestedObject("name"), "Audio Lights");
        if (!writeMessage(slot)) return false;

        StaticJsonDocument<512> space;
        space["$type"] = "addComponent";
        space["containerSlotId"] = rootId();
        JsonObject sdata = space.createNestedObject("data");
        sdata["id"] = std::string(LinkIds::ID_PREFIX) + "Space_" + tag_;
        sdata["componentType"] = LinkIds::SPACE_COMPONENT;
        setString(sdata.createNestedObject("members").createNestedObject("SpaceName"), "AudioLights");
        if (!writeMessage(space)) return false;

        rootCreated_ = true;
        return true;
    }

    bool writeMessage(const JsonDocument& doc) {
        if (doc.overflowed()) {
            DEBUG_ERROR("Transport message too large");
            writeErrors_++;
            return false;
        }
        if (!flushPending()) {
            // Reader is behind; never wait for it
            dropped_++;
            writeErrors_++;
            return false;
        }
        std::string line;
        serializeJson(doc, line);
        line += '\n';

        ssize_t n = writeSome(line.data(), line.size());
        if (n < 0) {
            // EPIPE once the bridge is gone (SIGPIPE is ignored by the app)
            writeErrors_++;
            return false;
        }
        if (n == 0) {
            dropped_++;
            writeErrors_++;
            return false;
        }
        if ((size_t)n < line.size()) {
            pending_.assign(line, (size_t)n, std::string::npos);
        }
        messages_++;
        return true;
    }

    static void setReference(JsonObject obj, const std::string& targetId) {
        obj["$type"] = "reference";
        obj["targetId"] = targetId;
    }

    static void setString(JsonObject obj, const std::string& value) {
        obj["$type"] = "string";
        obj["value"] = value;
    }

    static void setFloat(JsonObject obj, float value) {
        obj["$type"] = "float";
        obj["value"] = value;
    }

    static void setFloat3(JsonObject obj, float x, float y, float z) {
        obj["$type"] = "float3";
        JsonObject v = obj.createNestedObject("value");
        v["x"] = x;
        v["y"] = y;
        v["z"] = z;
    }

    // Prevent copying
    JsonLineTransport(const JsonLineTransport&) = delete;
    JsonLineTransport& operator=(const JsonLineTransport&) = delete;
};
