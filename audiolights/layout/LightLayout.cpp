#include "LightLayout.h"
#include "../types/LightsAssert.h"
#include <strings.h>

namespace {
    const LightDescriptor EMPTY_DESCRIPTOR;
    const Vec3 ORIGIN;
}

LightLayout::LightLayout() {
    for (int z = 0; z < NUM_ZONES; z++) {
        counts_[z] = 0;
        zoneStart_[z] = 0;
    }
}

LightLayout::LightLayout(const int counts[NUM_ZONES], const LayoutGeometry& geometry)
    : geometry_(geometry) {
    int next = 0;
    for (int z = 0; z < NUM_ZONES; z++) {
        int n = counts[z] > 0 ? counts[z] : 0;
        counts_[z] = n;
        zoneStart_[z] = next;
        Zone zone = ZoneInfo::fromIndex(z);

        for (int i = 0; i < n; i++) {
            LightDescriptor d;
            d.globalIndex = next;
            d.zone = zone;
            d.zoneIndex = i;
            d.zoneCount = n;
            lights_.push_back(d);
            positions_.push_back(computePosition(zone, i, n));
            zoneLights_[z].push_back(next);
            next++;
        }
    }
}

Vec3 LightLayout::computePosition(Zone zone, int zoneIndex, int zoneCount) const {
    Vec3 anchor;
    switch (zone) {
        case Zone::TOP:
            anchor = Vec3(0.0f, geometry_.topHeight, 0.0f);
            break;
        case Zone::BOTTOM:
            anchor = Vec3(0.0f, geometry_.bottomHeight, 0.0f);
            break;
        default:
            anchor = ZoneInfo::direction(zone) * geometry_.radius;
            anchor.y = geometry_.height;
            break;
    }

    // Centered spread: offsets are symmetric around the anchor
    float offset = ((float)zoneIndex - (float)(zoneCount - 1) * 0.5f) * geometry_.spacing;

    // Side walls spread vertically, everything else along x
    if (zone == Zone::LEFT || zone == Zone::RIGHT) {
        anchor.y += offset;
    } else {
        anchor.x += offset;
    }

    return geometry_.center + anchor;
}

int LightLayout::zoneCount(Zone zone) const {
    int z = ZoneInfo::toIndex(zone);
    return (z >= 0 && z < NUM_ZONES) ? counts_[z] : 0;
}

const LightDescriptor& LightLayout::descriptor(int globalIndex) const {
    LIGHTS_ASSERT(globalIndex >= 0 && globalIndex < total(), "OOB index in LightLayout::descriptor");
    if (globalIndex < 0 || globalIndex >= total()) {
        return EMPTY_DESCRIPTOR;
    }
    return lights_[globalIndex];
}

const Vec3& LightLayout::position(int globalIndex) const {
    LIGHTS_ASSERT(globalIndex >= 0 && globalIndex < total(), "OOB index in LightLayout::position");
    if (globalIndex < 0 || globalIndex >= total()) {
        return ORIGIN;
    }
    return positions_[globalIndex];
}

const std::vector<int>& LightLayout::lightsInZone(Zone zone) const {
    return zoneLights_[ZoneInfo::toIndex(zone)];
}

int LightLayout::globalIndex(Zone zone, int zoneIndex) const {
    int z = ZoneInfo::toIndex(zone);
    if (zoneIndex < 0 || zoneIndex >= counts_[z]) {
        return -1;
    }
    return zoneStart_[z] + zoneIndex;
}

bool LightLayout::zoneFromName(const char* name, Zone& out) {
    if (!name) return false;
    for (int z = 0; z < NUM_ZONES; z++) {
        Zone zone = ZoneInfo::fromIndex(z);
        if (strcasecmp(name, ZoneInfo::name(zone)) == 0) {
            out = zone;
            return true;
        }
    }
    return false;
}
