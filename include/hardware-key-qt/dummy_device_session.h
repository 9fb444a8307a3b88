#pragma once

#include "device_session.h"

namespace HardwareKey {

/**
 * @brief Synthetic security key for debug builds without any transport
 *
 * Injected by ConnectionCoordinator when neither wired nor proximity
 * hardware is available and debug injection is enabled. Every APDU is
 * answered with the same fixed response.
 */
class DummyDeviceSession : public DeviceSession {
public:
    DummyDeviceSession();
    explicit DummyDeviceSession(const QByteArray& fixedResponse);

    QByteArray transmit(const QByteArray& apdu) override;
    bool isConnected() const override { return true; }
    ConnectionMethod connectionMethod() const override { return ConnectionMethod::None; }
    QString description() const override { return "Dummy security key"; }

    /**
     * @brief Response returned for every APDU (payload followed by 9000)
     */
    QByteArray fixedResponse() const { return m_fixedResponse; }

    int transmitCount() const { return m_transmitCount; }

private:
    QByteArray m_fixedResponse;
    int m_transmitCount = 0;
};

} // namespace HardwareKey
