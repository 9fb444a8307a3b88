// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/event_router.h"
#include "hardware-key-qt/connection_coordinator.h"
#include "hardware-key-qt/proximity_channel.h"
#include "hardware-key-qt/wired_channel.h"
#include <QDebug>

namespace HardwareKey {

EventRouter::EventRouter(ConnectionCoordinator& coordinator)
    : m_coordinator(coordinator)
{
}

void EventRouter::onNotification(const PlatformEvent& event)
{
    qDebug() << "EventRouter: Received" << event.kind;

    switch (event.kind) {
        case NotificationKind::GrantResponse: {
            if (!m_coordinator.isConnectPending()) {
                discard(event, "no connect request pending");
                return;
            }
            std::unique_ptr<DeviceSession> session =
                m_coordinator.wiredChannel().handleGrantResponse(event.device, event.granted);
            if (session) {
                m_coordinator.onDeviceAvailable(std::move(session), ConnectionMethod::Wired);
            }
            return;
        }

        case NotificationKind::DeviceAttached: {
            if (!m_coordinator.isConnectPending()) {
                discard(event, "no connect request pending");
                return;
            }
            std::unique_ptr<DeviceSession> session =
                m_coordinator.wiredChannel().handleDeviceAttached(event.device);
            if (session) {
                m_coordinator.onDeviceAvailable(std::move(session), ConnectionMethod::Wired);
            }
            return;
        }

        case NotificationKind::DeviceDetached: {
            if (!m_coordinator.wiredChannel().handleDeviceDetached(event.device)) {
                discard(event, "not a recognized device");
                return;
            }
            m_coordinator.onDeviceRemoved();
            return;
        }

        case NotificationKind::DeviceSensed: {
            if (!m_coordinator.isConnectPending()) {
                discard(event, "no connect request pending");
                return;
            }
            std::unique_ptr<DeviceSession> session =
                m_coordinator.proximityChannel().handleTagSensed(event.tag);
            if (session) {
                m_coordinator.onDeviceAvailable(std::move(session), ConnectionMethod::Proximity);
            }
            return;
        }
    }
}

void EventRouter::discard(const PlatformEvent& event, const char* reason)
{
    ++m_discarded;
    qDebug() << "EventRouter: Discarding" << event.kind << "-" << reason;
}

} // namespace HardwareKey
