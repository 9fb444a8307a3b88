#pragma once

#include "device_identity.h"
#include "device_session.h"
#include "subscription_handle.h"
#include "backends/platform_backend.h"
#include <QPointer>
#include <QSet>
#include <memory>

namespace HardwareKey {

/**
 * @brief Wired (USB) discovery channel
 *
 * Owns the access-grant request protocol:
 * 1. arm() subscribes to DeviceAttached and GrantResponse notifications and
 *    requests access to every recognized device already attached.
 * 2. A device whose grant is already held is opened immediately; otherwise
 *    a grant prompt is issued and the answer arrives later as a
 *    GrantResponse event (handleGrantResponse()).
 * 3. disarm() drops the subscriptions and forgets outstanding prompts.
 *    The platform has no way to cancel a prompt; its answer is simply
 *    no longer routed here.
 *
 * Separately, watchDetach()/unwatchDetach() hold the DeviceDetached
 * subscription used to notice the connected key being unplugged.
 *
 * Records that do not match the DeviceIdentity are ignored everywhere.
 */
class WiredChannel {
public:
    WiredChannel(PlatformBackend* backend,
                 NotificationObserver* observer,
                 const DeviceIdentity& identity);
    ~WiredChannel();

    WiredChannel(const WiredChannel&) = delete;
    WiredChannel& operator=(const WiredChannel&) = delete;

    /**
     * @brief Subscribe and request access to attached devices
     * @return Session of the first attached device whose grant was
     *         already held, or nullptr if access is still pending
     *
     * No-op (returns nullptr) if already armed.
     */
    std::unique_ptr<DeviceSession> arm();

    /**
     * @brief Drop attach/grant subscriptions; safe when not armed
     */
    void disarm();

    bool isArmed() const;

    /**
     * @brief Subscribe to DeviceDetached; no-op if already watching
     */
    void watchDetach();

    /**
     * @brief Drop the DeviceDetached subscription; safe when not watching
     */
    void unwatchDetach();

    bool isWatchingDetach() const { return m_detachSubscription.isValid(); }

    /**
     * @brief Whether a recognized device is attached right now
     */
    bool isDevicePresent() const;

    bool isRecognized(const DeviceRecord& device) const { return m_identity.matches(device); }

    /**
     * @brief Number of grant prompts issued and not yet answered
     */
    int pendingPromptCount() const { return m_pendingPrompts.size(); }

    /**
     * @brief A device was plugged in while armed
     * @return Session if the grant was already held
     */
    std::unique_ptr<DeviceSession> handleDeviceAttached(const DeviceRecord& device);

    /**
     * @brief The platform answered a grant prompt
     * @return Session if the grant was given and the device is still attached
     */
    std::unique_ptr<DeviceSession> handleGrantResponse(const DeviceRecord& device, bool granted);

    /**
     * @brief A device was unplugged
     * @return true if the device is a recognized security key
     */
    bool handleDeviceDetached(const DeviceRecord& device);

private:
    std::unique_ptr<DeviceSession> requestAccess(const DeviceRecord& device);
    bool isAttached(const DeviceRecord& device) const;
    void release(SubscriptionHandle& handle);

    QPointer<PlatformBackend> m_backend;
    NotificationObserver* m_observer;
    DeviceIdentity m_identity;

    SubscriptionHandle m_attachSubscription;
    SubscriptionHandle m_grantSubscription;
    SubscriptionHandle m_detachSubscription;

    QSet<QString> m_pendingPrompts;  // device paths with an unanswered prompt
};

} // namespace HardwareKey
