#pragma once
#include "Zone.h"
#include <vector>

/**
 * LayoutGeometry - Room dimensions used to place lights
 *
 * Wall zones (left/right/front/back) sit at `radius` from the center at
 * `height`. Top and bottom zones sit directly above/below the center.
 * Lights inside a zone are spread `spacing` apart, centered on the anchor.
 */
struct LayoutGeometry {
    Vec3 center;                 // Offset applied to every position
    float radius = 3.0f;
    float height = 1.5f;
    float topHeight = 4.0f;
    float bottomHeight = -0.5f;
    float spacing = 0.5f;
};

/**
 * LightLayout - Immutable description of every light in the installation
 *
 * Built once from per-zone counts. Global ordering is zone declaration
 * order, then index within zone. Two layouts built from equal inputs
 * produce identical descriptors and positions.
 *
 * Counts must already be validated (non-negative); negative counts are
 * treated as zero here.
 */
class LightLayout {
public:
    LightLayout();
    LightLayout(const int counts[NUM_ZONES], const LayoutGeometry& geometry);

    int total() const { return (int)lights_.size(); }
    bool isEmpty() const { return lights_.empty(); }
    int zoneCount(Zone zone) const;

    // Descriptor of a light; falls back to index 0 on bad input
    const LightDescriptor& descriptor(int globalIndex) const;
    const Vec3& position(int globalIndex) const;

    // Global indices of a zone's lights, in zone order
    const std::vector<int>& lightsInZone(Zone zone) const;

    // -1 when the zone index is out of range
    int globalIndex(Zone zone, int zoneIndex) const;

    const LayoutGeometry& geometry() const { return geometry_; }

    // Zone name lookup ("left", "RIGHT", ...); false when unknown
    static bool zoneFromName(const char* name, Zone& out);

private:
    Vec3 computePosition(Zone zone, int zoneIndex, int zoneCount) const;

    LayoutGeometry geometry_;
    int counts_[NUM_ZONES];
    std::vector<LightDescriptor> lights_;
    std::vector<Vec3> positions_;
    std::vector<int> zoneLights_[NUM_ZONES];
    int zoneStart_[NUM_ZONES];
};
