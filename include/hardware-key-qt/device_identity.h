#pragma once

#include "types.h"
#include <QSet>
#include <QStringList>

namespace HardwareKey {

/**
 * @brief Criterion recognizing security keys among platform device records
 *
 * Wired records match on USB vendor/product id when the platform reports
 * them, otherwise on a product-name prefix (PC/SC reader names). Proximity
 * tags match on technology.
 */
class DeviceIdentity {
public:
    DeviceIdentity(quint16 vendorId,
                   const QSet<quint16>& productIds,
                   const QStringList& namePrefixes,
                   ProximityTechnology technology);

    /**
     * @brief Identity of Yubico YubiKey devices (NEO, 4, 5 series)
     */
    static DeviceIdentity yubiKey();

    bool matches(const DeviceRecord& record) const;
    bool matches(const ProximityTag& tag) const;

    quint16 vendorId() const { return m_vendorId; }
    ProximityTechnology technology() const { return m_technology; }

private:
    quint16 m_vendorId;
    QSet<quint16> m_productIds;
    QStringList m_namePrefixes;
    ProximityTechnology m_technology;
};

} // namespace HardwareKey
