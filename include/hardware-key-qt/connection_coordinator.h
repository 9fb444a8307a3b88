#pragma once

#include "capability_probe.h"
#include "device_identity.h"
#include "device_session.h"
#include "event_router.h"
#include "lifecycle_binder.h"
#include "proximity_channel.h"
#include "single_slot.h"
#include "types.h"
#include "wired_channel.h"
#include "backends/lifecycle_source.h"
#include "backends/platform_backend.h"
#include <QObject>
#include <QPointer>
#include <memory>

namespace HardwareKey {

/**
 * @brief Connection state machine for a security key on one host surface
 *
 * Arbitrates between the wired channel (USB, access grant required) and the
 * proximity channel (NFC, only while the surface is in front) and delivers
 * each result exactly once:
 *
 * - requestConnect(): the callback runs once with the session of whichever
 *   channel reports a device first. The other channel is disarmed before
 *   the callback runs.
 * - requestUnplugNotice(): the callback runs once when the wired key is
 *   removed, or immediately if there is none to wait for.
 *
 * Discovery follows the lifecycle of the host surface, fed through a
 * LifecycleSource: wired discovery while started, proximity discovery while
 * resumed, everything released on destroyed.
 *
 * **Thread Safety**: Use from the thread the coordinator lives on (the GUI
 * thread). Callbacks are invoked on that thread.
 *
 * **Example Usage**:
 * ```cpp
 * auto coordinator = new ConnectionCoordinator(this);
 * coordinator->requestConnect([](std::unique_ptr<DeviceSession> session) {
 *     qDebug() << "Security key connected:" << session->description();
 * });
 * ```
 */
class ConnectionCoordinator : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Create a coordinator with the default platform backend
     * @param parent QObject parent
     *
     * Creates QtPlatformBackend and an ApplicationLifecycleSource bound to
     * the running QGuiApplication.
     */
    explicit ConnectionCoordinator(QObject* parent = nullptr);

    /**
     * @brief Create a coordinator with injected collaborators (for testing/DI)
     * @param backend Platform backend (adopted if it has no parent)
     * @param lifecycle Lifecycle source of the host surface (adopted if it has no parent)
     * @param parent QObject parent
     */
    ConnectionCoordinator(PlatformBackend* backend,
                          LifecycleSource* lifecycle,
                          QObject* parent = nullptr);

    ~ConnectionCoordinator() override;

    /**
     * @brief Wait for a security key to connect
     * @param callback Invoked once with the session of the first key found
     * @throws std::logic_error if a connect request is already pending or
     *         the callback is empty
     *
     * With no connection method available and debug injection enabled, the
     * callback is invoked before this method returns with a
     * DummyDeviceSession.
     */
    void requestConnect(ConnectCallback callback);

    /**
     * @brief Wait until no wired security key is plugged in
     * @param callback Invoked once when the key is removed. Invoked before
     *        this method returns if wired host mode is unsupported or no key
     *        is plugged in.
     * @throws std::logic_error if an unplug notice is already pending or the
     *         callback is empty
     */
    void requestUnplugNotice(UnplugCallback callback);

    /**
     * @brief Connection methods the platform supports right now
     */
    ConnectionMethods supportedConnectionMethods() const;

    /**
     * @brief Whether a recognized wired key is plugged in
     */
    bool isWiredDevicePresent() const;

    ConnectionState state() const { return m_state; }
    bool isConnectPending() const { return m_connectSlot.isSet(); }
    bool isUnplugPending() const { return m_unplugSlot.isSet(); }

    /**
     * @brief Transport of the current connection, None if not connected
     */
    ConnectionMethod connectedVia() const { return m_connectedVia; }

    /**
     * @brief Allow the dummy session when no connection method exists
     *
     * Defaults to on in debug builds (and in builds configured with
     * HARDWARE_KEY_DEBUG_INJECTION), off otherwise.
     */
    void setDebugInjectionEnabled(bool enabled) { m_debugInjection = enabled; }
    bool isDebugInjectionEnabled() const { return m_debugInjection; }

    PlatformBackend* backend() const { return m_backend; }
    const WiredChannel& wiredChannelState() const { return *m_wired; }
    const ProximityChannel& proximityChannelState() const { return *m_proximity; }
    const LifecycleBinder& lifecycle() const { return *m_binder; }

    // Host-surface hooks, called by LifecycleBinder
    void onSurfaceStarted();
    void onSurfaceResumed();
    void onSurfacePaused();
    void onSurfaceStopped();
    void onSurfaceDestroyed();

signals:
    /**
     * @brief Emitted whenever the connection state changes
     */
    void stateChanged(HardwareKey::ConnectionState state);

private:
    friend class EventRouter;

    void init();
    PlatformBackend* createDefaultBackend();
    LifecycleSource* createDefaultLifecycleSource();

    WiredChannel& wiredChannel() { return *m_wired; }
    ProximityChannel& proximityChannel() { return *m_proximity; }

    /**
     * @brief Arm the channels the platform and surface phase allow
     */
    void armForConnect();
    void armWired();
    void injectDummyDevice();
    void disarmAll();
    void armUnplugWatch();

    // Transitions driven by EventRouter
    void onDeviceAvailable(std::unique_ptr<DeviceSession> session, ConnectionMethod via);
    void onDeviceRemoved();

    void deliverUnplug();
    void setState(ConnectionState state);

    QPointer<PlatformBackend> m_backend;
    QPointer<LifecycleSource> m_lifecycleSource;
    CapabilityProbe m_probe;
    DeviceIdentity m_identity;

    // Destroyed in reverse order: channels before the router they notify
    std::unique_ptr<EventRouter> m_router;
    std::unique_ptr<LifecycleBinder> m_binder;
    std::unique_ptr<WiredChannel> m_wired;
    std::unique_ptr<ProximityChannel> m_proximity;

    ConnectionState m_state = ConnectionState::Idle;
    ConnectionMethod m_connectedVia = ConnectionMethod::None;
    SingleSlot<ConnectCallback> m_connectSlot;
    SingleSlot<UnplugCallback> m_unplugSlot;
    bool m_debugInjection;
};

} // namespace HardwareKey
