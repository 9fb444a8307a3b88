#pragma once

#include "observers.h"

namespace HardwareKey {

class ConnectionCoordinator;

/**
 * @brief Single entry point for platform notifications
 *
 * Registered by both channels as their NotificationObserver. Each event is
 * handed to the channel that understands it and the outcome is turned into
 * a coordinator transition:
 * - GrantResponse / DeviceAttached -> WiredChannel -> onDeviceAvailable()
 * - DeviceSensed -> ProximityChannel -> onDeviceAvailable()
 * - DeviceDetached -> WiredChannel filter -> onDeviceRemoved()
 *
 * Connect-channel events are discarded while no connect request is pending.
 */
class EventRouter : public NotificationObserver {
public:
    explicit EventRouter(ConnectionCoordinator& coordinator);

    void onNotification(const PlatformEvent& event) override;

    /**
     * @brief Number of events dropped because nothing was waiting for them
     */
    int discardedCount() const { return m_discarded; }

private:
    void discard(const PlatformEvent& event, const char* reason);

    ConnectionCoordinator& m_coordinator;
    int m_discarded = 0;
};

} // namespace HardwareKey
