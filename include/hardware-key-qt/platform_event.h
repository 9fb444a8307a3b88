#pragma once

#include "types.h"

namespace HardwareKey {

/**
 * @brief Kinds of asynchronous notifications the platform delivers
 */
enum class NotificationKind {
    GrantResponse,   ///< Answer to an access-grant prompt
    DeviceAttached,  ///< Wired device plugged in
    DeviceDetached,  ///< Wired device removed
    DeviceSensed,    ///< Proximity tag entered the field
};

/**
 * @brief Tagged platform notification
 *
 * Only the fields matching the kind are meaningful: device for the three
 * wired kinds, granted for GrantResponse, tag for DeviceSensed. Build
 * instances through the static factories.
 */
struct PlatformEvent {
    NotificationKind kind = NotificationKind::DeviceAttached;
    DeviceRecord device;
    bool granted = false;
    ProximityTag tag;

    static PlatformEvent grantResponse(const DeviceRecord& device, bool granted) {
        PlatformEvent event;
        event.kind = NotificationKind::GrantResponse;
        event.device = device;
        event.granted = granted;
        return event;
    }

    static PlatformEvent deviceAttached(const DeviceRecord& device) {
        PlatformEvent event;
        event.kind = NotificationKind::DeviceAttached;
        event.device = device;
        return event;
    }

    static PlatformEvent deviceDetached(const DeviceRecord& device) {
        PlatformEvent event;
        event.kind = NotificationKind::DeviceDetached;
        event.device = device;
        return event;
    }

    static PlatformEvent deviceSensed(const ProximityTag& tag) {
        PlatformEvent event;
        event.kind = NotificationKind::DeviceSensed;
        event.tag = tag;
        return event;
    }
};

QDebug operator<<(QDebug debug, NotificationKind kind);

} // namespace HardwareKey
