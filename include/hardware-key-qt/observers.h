#pragma once

#include "platform_event.h"

namespace HardwareKey {

/**
 * @brief Receiver role for platform notifications
 *
 * Registered on the notification bus through PlatformBackend. Called on the
 * thread that owns the backend.
 */
class NotificationObserver {
public:
    virtual ~NotificationObserver() = default;
    virtual void onNotification(const PlatformEvent& event) = 0;
};

/**
 * @brief Receiver role for host-surface lifecycle events
 *
 * Registered on a LifecycleSource.
 */
class LifecycleObserver {
public:
    virtual ~LifecycleObserver() = default;
    virtual void onLifecycleEvent(SurfacePhase phase) = 0;
};

} // namespace HardwareKey
