#pragma once
#include <stdint.h>
#include "../../layout/Zone.h"
#include "../../render/LightFrame.h"

// Opaque handle issued by the transport for a created light
typedef int32_t LightHandle;
constexpr LightHandle INVALID_LIGHT_HANDLE = -1;

/**
 * ILightTransport - Command channel to the remote 3D host
 *
 * All calls report failure through their return value and must return
 * within a bounded time. Delivery is best effort; the scheduler resends
 * a light whose update failed on the next tick.
 */
class ILightTransport {
public:
    virtual ~ILightTransport() = default;

    virtual bool createLight(const LightDescriptor& light, const Vec3& position,
                             LightHandle& handleOut) = 0;
    virtual bool updateLight(LightHandle handle, const LightFrame& frame) = 0;
    virtual bool removeLight(LightHandle handle) = 0;
};
