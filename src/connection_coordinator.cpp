// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/connection_coordinator.h"
#include "hardware-key-qt/dummy_device_session.h"
#include "hardware-key-qt/backends/application_lifecycle_source.h"
#include "hardware-key-qt/backends/qt_platform_backend.h"
#include <QDebug>
#include <stdexcept>

namespace HardwareKey {

namespace {

constexpr bool debugInjectionDefault()
{
#if !defined(QT_NO_DEBUG) || defined(HARDWARE_KEY_DEBUG_INJECTION)
    return true;
#else
    return false;
#endif
}

} // namespace

// Default constructor - creates platform backend and lifecycle source
ConnectionCoordinator::ConnectionCoordinator(QObject* parent)
    : QObject(parent)
    , m_probe(nullptr)
    , m_identity(DeviceIdentity::yubiKey())
    , m_debugInjection(debugInjectionDefault())
{
    qDebug() << "ConnectionCoordinator: Initializing with default platform backend";

    m_backend = createDefaultBackend();
    m_lifecycleSource = createDefaultLifecycleSource();
    init();
}

// DI constructor - accepts injected collaborators
ConnectionCoordinator::ConnectionCoordinator(PlatformBackend* backend,
                                             LifecycleSource* lifecycle,
                                             QObject* parent)
    : QObject(parent)
    , m_backend(backend)
    , m_lifecycleSource(lifecycle)
    , m_probe(nullptr)
    , m_identity(DeviceIdentity::yubiKey())
    , m_debugInjection(debugInjectionDefault())
{
    qDebug() << "ConnectionCoordinator: Initializing with injected backend";

    if (!m_backend) {
        qCritical() << "ConnectionCoordinator: Injected backend is null!";
    } else if (!m_backend->parent()) {
        m_backend->setParent(this);
    }

    if (m_lifecycleSource && !m_lifecycleSource->parent()) {
        m_lifecycleSource->setParent(this);
    }

    init();
}

ConnectionCoordinator::~ConnectionCoordinator()
{
    qDebug() << "ConnectionCoordinator: Destructor";
    disarmAll();
    m_binder->detach();
    // m_backend and m_lifecycleSource are deleted by QObject parent-child
}

void ConnectionCoordinator::init()
{
    m_probe = CapabilityProbe(m_backend);
    m_router = std::make_unique<EventRouter>(*this);
    m_binder = std::make_unique<LifecycleBinder>(*this, m_lifecycleSource);
    m_wired = std::make_unique<WiredChannel>(m_backend, m_router.get(), m_identity);
    m_proximity = std::make_unique<ProximityChannel>(m_backend, m_router.get(), m_identity, *m_binder);

    if (m_backend) {
        qDebug() << "ConnectionCoordinator: Backend:" << m_backend->backendName();
    }

    m_binder->attach();
}

PlatformBackend* ConnectionCoordinator::createDefaultBackend()
{
    qDebug() << "ConnectionCoordinator: Creating Qt platform backend";
    return new QtPlatformBackend(this);
}

LifecycleSource* ConnectionCoordinator::createDefaultLifecycleSource()
{
    return new ApplicationLifecycleSource(this);
}

void ConnectionCoordinator::requestConnect(ConnectCallback callback)
{
    if (!callback) {
        throw std::logic_error("requestConnect: callback is empty");
    }

    if (m_connectSlot.isSet()) {
        qCritical() << "ConnectionCoordinator: requestConnect() while a connect request is pending";
        throw std::logic_error("requestConnect: a connect request is already pending");
    }

    qDebug() << "ConnectionCoordinator: Waiting for a security key";
    m_connectSlot.set(std::move(callback));
    setState(ConnectionState::AwaitingConnect);

    armForConnect();
}

void ConnectionCoordinator::requestUnplugNotice(UnplugCallback callback)
{
    if (!callback) {
        throw std::logic_error("requestUnplugNotice: callback is empty");
    }

    if (!supportedConnectionMethods().testFlag(ConnectionMethod::Wired)) {
        qDebug() << "ConnectionCoordinator: No wired host mode, nothing to unplug";
        callback();
        return;
    }

    if (!m_wired->isDevicePresent()) {
        qDebug() << "ConnectionCoordinator: No security key plugged in";
        callback();
        return;
    }

    if (m_unplugSlot.isSet()) {
        qCritical() << "ConnectionCoordinator: requestUnplugNotice() while an unplug notice is pending";
        throw std::logic_error("requestUnplugNotice: an unplug notice is already pending");
    }

    qDebug() << "ConnectionCoordinator: Waiting for the security key to be unplugged";
    m_unplugSlot.set(std::move(callback));
    if (m_binder->isStarted()) {
        m_wired->watchDetach();
    }

    if (!m_connectSlot.isSet()) {
        setState(ConnectionState::AwaitingUnplug);
    }
}

ConnectionMethods ConnectionCoordinator::supportedConnectionMethods() const
{
    return m_probe.query();
}

bool ConnectionCoordinator::isWiredDevicePresent() const
{
    return m_wired->isDevicePresent();
}

void ConnectionCoordinator::armForConnect()
{
    const ConnectionMethods methods = supportedConnectionMethods();

    if (!methods) {
        if (m_debugInjection) {
            injectDummyDevice();
        } else {
            qDebug() << "ConnectionCoordinator: No connection method available, waiting";
        }
        return;
    }

    if (methods.testFlag(ConnectionMethod::Wired) && m_binder->isStarted()) {
        armWired();
    }

    // Wired may already have won
    if (!m_connectSlot.isSet()) {
        return;
    }

    if (methods.testFlag(ConnectionMethod::Proximity) && m_binder->isResumed()) {
        m_proximity->arm();
    }
}

void ConnectionCoordinator::armWired()
{
    std::unique_ptr<DeviceSession> session = m_wired->arm();
    if (session) {
        onDeviceAvailable(std::move(session), ConnectionMethod::Wired);
    }
}

void ConnectionCoordinator::injectDummyDevice()
{
    qDebug() << "ConnectionCoordinator: No connection method available, injecting dummy security key";
    onDeviceAvailable(std::make_unique<DummyDeviceSession>(), ConnectionMethod::None);
}

void ConnectionCoordinator::disarmAll()
{
    m_wired->disarm();
    m_wired->unwatchDetach();
    m_proximity->disarm();
}

void ConnectionCoordinator::armUnplugWatch()
{
    const bool wired = supportedConnectionMethods().testFlag(ConnectionMethod::Wired);
    if (!wired || !m_wired->isDevicePresent()) {
        // Removed while the surface was stopped
        deliverUnplug();
        return;
    }
    m_wired->watchDetach();
}

void ConnectionCoordinator::onDeviceAvailable(std::unique_ptr<DeviceSession> session, ConnectionMethod via)
{
    if (!m_connectSlot.isSet()) {
        qDebug() << "ConnectionCoordinator: Device available but no connect request pending, dropping it";
        return;
    }

    if (m_state != ConnectionState::Idle && m_state != ConnectionState::AwaitingConnect) {
        qWarning() << "ConnectionCoordinator: Device available in state" << m_state << ", dropping it";
        return;
    }

    // Loser first, so no second report can slip in
    if (via == ConnectionMethod::Proximity) {
        m_wired->disarm();
        m_proximity->disarm();
    } else {
        m_proximity->disarm();
        m_wired->disarm();
    }

    qDebug() << "ConnectionCoordinator: Security key connected:" << session->description();
    m_connectedVia = via;
    setState(ConnectionState::Connected);

    std::optional<ConnectCallback> callback = m_connectSlot.takeAndClear();
    (*callback)(std::move(session));
}

void ConnectionCoordinator::onDeviceRemoved()
{
    const bool wiredConnected = m_state == ConnectionState::Connected
        && m_connectedVia == ConnectionMethod::Wired;

    if (!wiredConnected && !m_unplugSlot.isSet()) {
        qDebug() << "ConnectionCoordinator: Device removed but nothing is waiting for it";
        return;
    }

    deliverUnplug();
}

void ConnectionCoordinator::deliverUnplug()
{
    qDebug() << "ConnectionCoordinator: Security key unplugged";
    m_wired->unwatchDetach();
    m_connectedVia = ConnectionMethod::None;
    setState(m_connectSlot.isSet() ? ConnectionState::AwaitingConnect : ConnectionState::Idle);

    std::optional<UnplugCallback> callback = m_unplugSlot.takeAndClear();
    if (callback) {
        (*callback)();
    }
}

void ConnectionCoordinator::onSurfaceStarted()
{
    if (m_connectSlot.isSet()) {
        const ConnectionMethods methods = supportedConnectionMethods();
        if (!methods && m_debugInjection) {
            injectDummyDevice();
        } else if (methods.testFlag(ConnectionMethod::Wired)) {
            armWired();
        }
    }

    if (m_unplugSlot.isSet()) {
        armUnplugWatch();
    }
}

void ConnectionCoordinator::onSurfaceResumed()
{
    if (!m_connectSlot.isSet()) {
        return;
    }
    if (supportedConnectionMethods().testFlag(ConnectionMethod::Proximity)) {
        m_proximity->arm();
    }
}

void ConnectionCoordinator::onSurfacePaused()
{
    m_proximity->disarm();
}

void ConnectionCoordinator::onSurfaceStopped()
{
    if (m_connectSlot.isSet() || m_unplugSlot.isSet()) {
        disarmAll();
    }
}

void ConnectionCoordinator::onSurfaceDestroyed()
{
    qDebug() << "ConnectionCoordinator: Surface destroyed, releasing everything";
    disarmAll();
    m_connectSlot.clear();
    m_unplugSlot.clear();
    m_connectedVia = ConnectionMethod::None;
    setState(ConnectionState::Idle);
}

void ConnectionCoordinator::setState(ConnectionState state)
{
    if (m_state == state) {
        return;
    }
    qDebug() << "ConnectionCoordinator: State" << m_state << "->" << state;
    m_state = state;
    emit stateChanged(state);
}

} // namespace HardwareKey
