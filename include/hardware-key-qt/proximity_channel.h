#pragma once

#include "device_identity.h"
#include "device_session.h"
#include "subscription_handle.h"
#include "backends/platform_backend.h"
#include <QPointer>
#include <memory>

namespace HardwareKey {

class LifecycleBinder;

/**
 * @brief Proximity (NFC) discovery channel
 *
 * Foreground tag dispatch only works while the host surface is resumed, so
 * arm() is a no-op unless the binder reports the surface as resumed. The
 * listener is restricted to the technology of the DeviceIdentity (ISO-DEP).
 */
class ProximityChannel {
public:
    ProximityChannel(PlatformBackend* backend,
                     NotificationObserver* observer,
                     const DeviceIdentity& identity,
                     const LifecycleBinder& surface);
    ~ProximityChannel();

    ProximityChannel(const ProximityChannel&) = delete;
    ProximityChannel& operator=(const ProximityChannel&) = delete;

    /**
     * @brief Enable the foreground listener
     * @return true if the listener is enabled after the call
     */
    bool arm();

    /**
     * @brief Disable the foreground listener; safe when not armed
     */
    void disarm();

    bool isArmed() const { return m_listener.isValid(); }

    /**
     * @brief A tag entered the field
     * @return Session, or nullptr if the tag is not a security key
     */
    std::unique_ptr<DeviceSession> handleTagSensed(const ProximityTag& tag);

private:
    QPointer<PlatformBackend> m_backend;
    NotificationObserver* m_observer;
    DeviceIdentity m_identity;
    const LifecycleBinder& m_surface;
    SubscriptionHandle m_listener;
};

} // namespace HardwareKey
