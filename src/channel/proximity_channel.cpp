// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/proximity_channel.h"
#include "hardware-key-qt/lifecycle_binder.h"
#include "hardware-key-qt/backends/platform_backend.h"
#include <QDebug>

namespace HardwareKey {

ProximityChannel::ProximityChannel(PlatformBackend* backend,
                                   NotificationObserver* observer,
                                   const DeviceIdentity& identity,
                                   const LifecycleBinder& surface)
    : m_backend(backend)
    , m_observer(observer)
    , m_identity(identity)
    , m_surface(surface)
{
}

ProximityChannel::~ProximityChannel()
{
    disarm();
}

bool ProximityChannel::arm()
{
    if (isArmed()) {
        return true;
    }

    // Foreground dispatch can only be enabled for a surface in front
    if (!m_surface.isResumed()) {
        qDebug() << "ProximityChannel: Surface not resumed, not arming";
        return false;
    }

    if (!m_backend) {
        qWarning() << "ProximityChannel: No backend available!";
        return false;
    }

    m_listener = m_backend->enableProximityListener(m_identity.technology(), m_observer);
    if (!m_listener.isValid()) {
        qWarning() << "ProximityChannel: Failed to enable foreground listener";
        return false;
    }

    qDebug() << "ProximityChannel: Foreground listener enabled";
    return true;
}

void ProximityChannel::disarm()
{
    if (!m_listener.isValid()) {
        return;
    }

    if (m_backend && !m_backend->disableProximityListener(m_listener)) {
        qWarning() << "ProximityChannel: Disabling listener failed, it was not enabled";
    }
    m_listener = SubscriptionHandle();
    qDebug() << "ProximityChannel: Foreground listener disabled";
}

std::unique_ptr<DeviceSession> ProximityChannel::handleTagSensed(const ProximityTag& tag)
{
    if (!isArmed()) {
        return nullptr;
    }

    if (!m_identity.matches(tag)) {
        qDebug() << "ProximityChannel: Ignoring tag" << tag.uid.toHex() << "without ISO-DEP";
        return nullptr;
    }

    std::unique_ptr<DeviceSession> session = m_backend->connectTag(tag);
    if (!session) {
        // Not a security key
        qDebug() << "ProximityChannel: ISO-DEP not obtainable for tag" << tag.uid.toHex();
    }
    return session;
}

} // namespace HardwareKey
