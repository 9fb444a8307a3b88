// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/wired_channel.h"
#include "hardware-key-qt/backends/platform_backend.h"
#include <QDebug>

namespace HardwareKey {

WiredChannel::WiredChannel(PlatformBackend* backend,
                           NotificationObserver* observer,
                           const DeviceIdentity& identity)
    : m_backend(backend)
    , m_observer(observer)
    , m_identity(identity)
{
}

WiredChannel::~WiredChannel()
{
    disarm();
    unwatchDetach();
}

std::unique_ptr<DeviceSession> WiredChannel::arm()
{
    if (isArmed()) {
        return nullptr;
    }
    if (!m_backend) {
        qWarning() << "WiredChannel: No backend available!";
        return nullptr;
    }

    qDebug() << "WiredChannel: Arming";
    m_attachSubscription = m_backend->registerObserver(NotificationKind::DeviceAttached, m_observer);
    m_grantSubscription = m_backend->registerObserver(NotificationKind::GrantResponse, m_observer);

    if (!m_attachSubscription.isValid() || !m_grantSubscription.isValid()) {
        qWarning() << "WiredChannel: Failed to subscribe to wired notifications";
        disarm();
        return nullptr;
    }

    const QList<DeviceRecord> devices = m_backend->attachedDevices();
    for (const DeviceRecord& device : devices) {
        std::unique_ptr<DeviceSession> session = requestAccess(device);
        if (session) {
            return session;
        }
    }
    return nullptr;
}

void WiredChannel::disarm()
{
    if (!isArmed() && m_pendingPrompts.isEmpty()) {
        return;
    }

    qDebug() << "WiredChannel: Disarming, untracked prompts:" << m_pendingPrompts.size();
    release(m_attachSubscription);
    release(m_grantSubscription);
    m_pendingPrompts.clear();
}

bool WiredChannel::isArmed() const
{
    return m_attachSubscription.isValid() || m_grantSubscription.isValid();
}

void WiredChannel::watchDetach()
{
    if (m_detachSubscription.isValid() || !m_backend) {
        return;
    }

    m_detachSubscription = m_backend->registerObserver(NotificationKind::DeviceDetached, m_observer);
    if (!m_detachSubscription.isValid()) {
        qWarning() << "WiredChannel: Failed to subscribe to detach notifications";
        return;
    }
    qDebug() << "WiredChannel: Watching for detach";
}

void WiredChannel::unwatchDetach()
{
    release(m_detachSubscription);
}

bool WiredChannel::isDevicePresent() const
{
    if (!m_backend) {
        return false;
    }

    const QList<DeviceRecord> devices = m_backend->attachedDevices();
    for (const DeviceRecord& device : devices) {
        if (m_identity.matches(device)) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<DeviceSession> WiredChannel::handleDeviceAttached(const DeviceRecord& device)
{
    if (!isArmed()) {
        return nullptr;
    }
    return requestAccess(device);
}

std::unique_ptr<DeviceSession> WiredChannel::handleGrantResponse(const DeviceRecord& device, bool granted)
{
    if (!isArmed() || !m_identity.matches(device)) {
        return nullptr;
    }

    m_pendingPrompts.remove(device.path);

    // Do not keep asking for a key that was unplugged before the prompt was answered
    if (!isAttached(device)) {
        qDebug() << "WiredChannel: Grant response for a device that is gone:" << device;
        return nullptr;
    }

    if (!granted) {
        qDebug() << "WiredChannel: Access denied for" << device;
        return nullptr;
    }

    return requestAccess(device);
}

bool WiredChannel::handleDeviceDetached(const DeviceRecord& device)
{
    if (!m_identity.matches(device)) {
        return false;
    }

    m_pendingPrompts.remove(device.path);
    return true;
}

std::unique_ptr<DeviceSession> WiredChannel::requestAccess(const DeviceRecord& device)
{
    if (!m_identity.matches(device)) {
        return nullptr;
    }

    if (m_backend->hasAccessGrant(device)) {
        qDebug() << "WiredChannel: Access already granted, opening" << device;
        std::unique_ptr<DeviceSession> session = m_backend->openDevice(device);
        if (!session) {
            qWarning() << "WiredChannel: Failed to open" << device;
        }
        return session;
    }

    if (m_pendingPrompts.contains(device.path)) {
        qDebug() << "WiredChannel: Grant prompt already outstanding for" << device;
        return nullptr;
    }

    qDebug() << "WiredChannel: Requesting access grant for" << device;
    m_pendingPrompts.insert(device.path);
    m_backend->requestAccessGrant(device);
    return nullptr;
}

bool WiredChannel::isAttached(const DeviceRecord& device) const
{
    const QList<DeviceRecord> devices = m_backend->attachedDevices();
    for (const DeviceRecord& attached : devices) {
        if (attached.path == device.path) {
            return true;
        }
    }
    return false;
}

void WiredChannel::release(SubscriptionHandle& handle)
{
    if (!handle.isValid()) {
        return;
    }
    if (m_backend && !m_backend->unregisterObserver(handle)) {
        qWarning() << "WiredChannel: Unregistering" << handle.kind() << "observer failed, it was not registered";
    }
    handle = SubscriptionHandle();
}

} // namespace HardwareKey
