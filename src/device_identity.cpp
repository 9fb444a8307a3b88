// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/device_identity.h"

namespace HardwareKey {

namespace {

constexpr quint16 YUBICO_VENDOR_ID = 0x1050;

// Product ids of the USB interface combinations YubiKeys enumerate with
const QSet<quint16> YUBIKEY_PRODUCT_IDS = {
    0x0010,  // YubiKey (v1/v2)
    0x0110,  // NEO OTP
    0x0111,  // NEO OTP+CCID
    0x0114,  // NEO OTP+FIDO
    0x0116,  // NEO OTP+FIDO+CCID
    0x0401,  // 4/5 OTP
    0x0403,  // 4/5 OTP+FIDO
    0x0405,  // 4/5 OTP+CCID
    0x0407,  // 4/5 OTP+FIDO+CCID
    0x0410,  // Plus OTP+FIDO
};

} // namespace

DeviceIdentity::DeviceIdentity(quint16 vendorId,
                               const QSet<quint16>& productIds,
                               const QStringList& namePrefixes,
                               ProximityTechnology technology)
    : m_vendorId(vendorId)
    , m_productIds(productIds)
    , m_namePrefixes(namePrefixes)
    , m_technology(technology)
{
}

DeviceIdentity DeviceIdentity::yubiKey()
{
    return DeviceIdentity(YUBICO_VENDOR_ID,
                          YUBIKEY_PRODUCT_IDS,
                          {QStringLiteral("Yubico YubiKey"), QStringLiteral("Yubico Yubikey")},
                          ProximityTechnology::IsoDep);
}

bool DeviceIdentity::matches(const DeviceRecord& record) const
{
    if (!record.isValid()) {
        return false;
    }

    if (record.vendorId != 0) {
        return record.vendorId == m_vendorId && m_productIds.contains(record.productId);
    }

    // No USB ids (PC/SC): fall back to the product name the driver reports
    for (const QString& prefix : m_namePrefixes) {
        if (record.name.startsWith(prefix, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

bool DeviceIdentity::matches(const ProximityTag& tag) const
{
    return tag.technologies.testFlag(m_technology);
}

} // namespace HardwareKey
