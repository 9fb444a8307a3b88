// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/types.h"
#include "hardware-key-qt/platform_event.h"

namespace HardwareKey {

QDebug operator<<(QDebug debug, const DeviceRecord& record)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "DeviceRecord(" << record.path;
    if (record.vendorId != 0) {
        debug << ", " << QString("%1:%2")
                             .arg(record.vendorId, 4, 16, QChar('0'))
                             .arg(record.productId, 4, 16, QChar('0'));
    }
    debug << ")";
    return debug;
}

QDebug operator<<(QDebug debug, ConnectionState state)
{
    QDebugStateSaver saver(debug);
    debug.noquote();
    switch (state) {
        case ConnectionState::Idle:
            debug << "Idle";
            break;
        case ConnectionState::AwaitingConnect:
            debug << "AwaitingConnect";
            break;
        case ConnectionState::Connected:
            debug << "Connected";
            break;
        case ConnectionState::AwaitingUnplug:
            debug << "AwaitingUnplug";
            break;
    }
    return debug;
}

QDebug operator<<(QDebug debug, SurfacePhase phase)
{
    QDebugStateSaver saver(debug);
    debug.noquote();
    switch (phase) {
        case SurfacePhase::Created:
            debug << "Created";
            break;
        case SurfacePhase::Started:
            debug << "Started";
            break;
        case SurfacePhase::Resumed:
            debug << "Resumed";
            break;
        case SurfacePhase::Paused:
            debug << "Paused";
            break;
        case SurfacePhase::Stopped:
            debug << "Stopped";
            break;
        case SurfacePhase::Destroyed:
            debug << "Destroyed";
            break;
    }
    return debug;
}

QDebug operator<<(QDebug debug, NotificationKind kind)
{
    QDebugStateSaver saver(debug);
    debug.noquote();
    switch (kind) {
        case NotificationKind::GrantResponse:
            debug << "GrantResponse";
            break;
        case NotificationKind::DeviceAttached:
            debug << "DeviceAttached";
            break;
        case NotificationKind::DeviceDetached:
            debug << "DeviceDetached";
            break;
        case NotificationKind::DeviceSensed:
            debug << "DeviceSensed";
            break;
    }
    return debug;
}

} // namespace HardwareKey
