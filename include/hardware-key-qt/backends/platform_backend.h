#pragma once

#include "../device_session.h"
#include "../observers.h"
#include "../subscription_handle.h"
#include "../types.h"
#include <QList>
#include <QObject>
#include <memory>

namespace HardwareKey {

/**
 * @brief Abstract interface to the host platform
 *
 * Bundles the four platform surfaces the connection core talks to:
 * - Capability query surface (which transports exist / are enabled)
 * - Wired device manager (attached devices, access grants, opening)
 * - Notification bus (subscription registry for wired notifications)
 * - Proximity adapter (foreground tag listener, tag sessions)
 *
 * Backend Selection:
 * - QtPlatformBackend: PC/SC readers (desktop) + Qt NFC
 * - MockPlatformBackend: hardware-free backend used by the tests
 *
 * Thread Safety:
 * Methods are called from, and observers are notified on, the thread the
 * backend lives on.
 */
class PlatformBackend : public QObject
{
    Q_OBJECT

public:
    explicit PlatformBackend(QObject* parent = nullptr) : QObject(parent) {}
    virtual ~PlatformBackend() = default;

    // ------------------------------------------------------------------
    // Capability query surface
    // ------------------------------------------------------------------

    /**
     * @brief Whether wired host mode is present (USB host / PC/SC service)
     */
    virtual bool hasWiredHostMode() const = 0;

    /**
     * @brief Whether proximity sensing hardware is present
     */
    virtual bool hasProximitySupport() const = 0;

    /**
     * @brief Whether proximity sensing is currently switched on
     */
    virtual bool isProximityEnabled() const = 0;

    // ------------------------------------------------------------------
    // Wired device manager
    // ------------------------------------------------------------------

    /**
     * @brief Wired devices currently attached, unfiltered
     */
    virtual QList<DeviceRecord> attachedDevices() const = 0;

    /**
     * @brief Whether this process already holds the access grant for a device
     */
    virtual bool hasAccessGrant(const DeviceRecord& device) const = 0;

    /**
     * @brief Prompt for an access grant
     *
     * Returns immediately. The answer is delivered later as a
     * NotificationKind::GrantResponse event to the registered observers.
     * There is no way to cancel an outstanding prompt.
     */
    virtual void requestAccessGrant(const DeviceRecord& device) = 0;

    /**
     * @brief Open a device the grant is held for
     * @return Session, or nullptr if the device could not be opened
     */
    virtual std::unique_ptr<DeviceSession> openDevice(const DeviceRecord& device) = 0;

    // ------------------------------------------------------------------
    // Notification bus
    // ------------------------------------------------------------------

    /**
     * @brief Register an observer for one wired notification kind
     * @return Handle identifying the registration (invalid on failure)
     */
    virtual SubscriptionHandle registerObserver(NotificationKind kind, NotificationObserver* observer) = 0;

    /**
     * @brief Remove a registration
     * @return false if the handle is not currently registered
     */
    virtual bool unregisterObserver(const SubscriptionHandle& handle) = 0;

    // ------------------------------------------------------------------
    // Proximity adapter
    // ------------------------------------------------------------------

    /**
     * @brief Start foreground tag dispatch restricted to a technology
     *
     * Sensed tags are delivered as NotificationKind::DeviceSensed events to
     * the observer until the listener is disabled.
     * @return Handle identifying the listener (invalid on failure)
     */
    virtual SubscriptionHandle enableProximityListener(ProximityTechnology technology,
                                                       NotificationObserver* observer) = 0;

    /**
     * @brief Stop foreground tag dispatch
     * @return false if the listener is not currently enabled
     */
    virtual bool disableProximityListener(const SubscriptionHandle& handle) = 0;

    /**
     * @brief Obtain an ISO-DEP session for a sensed tag
     * @return Session, or nullptr if the tag does not speak ISO-DEP
     */
    virtual std::unique_ptr<DeviceSession> connectTag(const ProximityTag& tag) = 0;

    /**
     * @brief Backend name for logging/debugging
     */
    virtual QString backendName() const = 0;
};

} // namespace HardwareKey
