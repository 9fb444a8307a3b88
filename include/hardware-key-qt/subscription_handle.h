#pragma once

#include "platform_event.h"
#include <QtGlobal>

namespace HardwareKey {

/**
 * @brief Token for one registration on the platform notification bus
 *
 * Returned by PlatformBackend::registerObserver() and
 * PlatformBackend::enableProximityListener(). A default-constructed handle is
 * invalid; channels use "do I hold a valid handle" as their armed check.
 */
class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    SubscriptionHandle(quint64 id, NotificationKind kind) : m_id(id), m_kind(kind) {}

    bool isValid() const { return m_id != 0; }
    quint64 id() const { return m_id; }
    NotificationKind kind() const { return m_kind; }

    bool operator==(const SubscriptionHandle& other) const { return m_id == other.m_id; }
    bool operator!=(const SubscriptionHandle& other) const { return m_id != other.m_id; }

private:
    quint64 m_id = 0;
    NotificationKind m_kind = NotificationKind::DeviceAttached;
};

} // namespace HardwareKey
