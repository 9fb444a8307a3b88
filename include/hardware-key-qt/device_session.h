#pragma once

#include "types.h"
#include <QByteArray>
#include <QString>
#include <functional>
#include <memory>

namespace HardwareKey {

/**
 * @brief Opened connection to a security key
 *
 * A session is created by a channel once a device became usable and is
 * handed to the caller of ConnectionCoordinator::requestConnect(). The
 * coordinator keeps no reference to it afterwards; the device protocol
 * (challenge/response) is driven by the caller through transmit().
 *
 * Implementations:
 * - PcscDeviceSession: wired key exposed as a CCID reader
 * - QtNfcDeviceSession: ISO-DEP tag via Qt NFC
 * - DummyDeviceSession: synthetic key for debug builds without hardware
 */
class DeviceSession {
public:
    virtual ~DeviceSession() = default;

    /**
     * @brief Transmit an APDU and wait for the response
     * @param apdu Command bytes
     * @return Response bytes including SW1/SW2
     * @throws std::runtime_error if the session is closed or transmission fails
     */
    virtual QByteArray transmit(const QByteArray& apdu) = 0;

    /**
     * @brief Check whether the session can still be used
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Transport this session was opened over
     */
    virtual ConnectionMethod connectionMethod() const = 0;

    /**
     * @brief Human-readable description for logging (reader name, tag uid)
     */
    virtual QString description() const = 0;
};

/// Invoked once with the session of the device that connected first
using ConnectCallback = std::function<void(std::unique_ptr<DeviceSession> session)>;

/// Invoked once when the connected wired device was removed
using UnplugCallback = std::function<void()>;

} // namespace HardwareKey
