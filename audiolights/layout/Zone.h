#pragma once
#include <stdint.h>

/**
 * Zone - Spatial group of lights around the room center
 *
 * Declaration order is also the global light ordering.
 */
enum class Zone : uint8_t {
    LEFT,
    RIGHT,
    FRONT,
    BACK,
    TOP,
    BOTTOM
};

constexpr int NUM_ZONES = 6;

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    Vec3() {}
    Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator+(const Vec3& o) const { return Vec3(x + o.x, y + o.y, z + o.z); }
    Vec3 operator*(float s) const { return Vec3(x * s, y * s, z * s); }
};

/**
 * LightDescriptor - Identity of one light in the layout
 */
struct LightDescriptor {
    int globalIndex = 0;   // Position in the global ordering
    Zone zone = Zone::LEFT;
    int zoneIndex = 0;     // Position within the zone
    int zoneCount = 0;     // Number of lights in the zone
};

namespace ZoneInfo {
    inline int toIndex(Zone z) { return (int)z; }

    inline Zone fromIndex(int i) {
        return (i >= 0 && i < NUM_ZONES) ? (Zone)i : Zone::LEFT;
    }

    inline const char* name(Zone z) {
        switch (z) {
            case Zone::LEFT:   return "left";
            case Zone::RIGHT:  return "right";
            case Zone::FRONT:  return "front";
            case Zone::BACK:   return "back";
            case Zone::TOP:    return "top";
            case Zone::BOTTOM: return "bottom";
            default:           return "unknown";
        }
    }

    // Unit direction from room center
    inline Vec3 direction(Zone z) {
        switch (z) {
            case Zone::LEFT:   return Vec3(-1.0f, 0.0f, 0.0f);
            case Zone::RIGHT:  return Vec3(1.0f, 0.0f, 0.0f);
            case Zone::FRONT:  return Vec3(0.0f, 0.0f, 1.0f);
            case Zone::BACK:   return Vec3(0.0f, 0.0f, -1.0f);
            case Zone::TOP:    return Vec3(0.0f, 1.0f, 0.0f);
            case Zone::BOTTOM: return Vec3(0.0f, -1.0f, 0.0f);
            default:           return Vec3();
        }
    }
}
