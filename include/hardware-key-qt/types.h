#pragma once

#include <QByteArray>
#include <QDebug>
#include <QFlags>
#include <QMetaType>
#include <QPointer>
#include <QObject>
#include <QString>

namespace HardwareKey {

/**
 * @brief Physical transport over which a security key can be reached
 */
enum class ConnectionMethod {
    None = 0x0,
    Wired = 0x1,      ///< USB host mode (CCID reader on desktop)
    Proximity = 0x2,  ///< NFC, ISO 14443-4
};
Q_DECLARE_FLAGS(ConnectionMethods, ConnectionMethod)
Q_DECLARE_OPERATORS_FOR_FLAGS(ConnectionMethods)

/**
 * @brief Connection state owned by ConnectionCoordinator
 */
enum class ConnectionState {
    Idle,             ///< Nothing requested, nothing connected
    AwaitingConnect,  ///< A connect request is pending
    Connected,        ///< A session was handed to the caller
    AwaitingUnplug,   ///< Waiting for the wired key to be removed
};

/**
 * @brief Visibility phases of the host surface
 */
enum class SurfacePhase {
    Created,
    Started,
    Resumed,
    Paused,
    Stopped,
    Destroyed,
};

/**
 * @brief Proximity tag technologies reported by the platform
 */
enum class ProximityTechnology {
    None = 0x0,
    IsoDep = 0x1,   ///< ISO 14443-4, the technology security keys answer on
    NfcA = 0x2,
    NfcB = 0x4,
    Ndef = 0x8,
    Mifare = 0x10,
};
Q_DECLARE_FLAGS(ProximityTechnologies, ProximityTechnology)
Q_DECLARE_OPERATORS_FOR_FLAGS(ProximityTechnologies)

/**
 * @brief Platform record of an attached wired device
 *
 * vendorId/productId are 0 when the platform does not expose them
 * (PC/SC only knows reader names).
 */
struct DeviceRecord {
    QString path;         ///< Platform-unique path (reader name, USB device path)
    QString name;         ///< Human-readable product name
    quint16 vendorId = 0;
    quint16 productId = 0;

    bool isValid() const { return !path.isEmpty(); }

    bool operator==(const DeviceRecord& other) const {
        return path == other.path
            && vendorId == other.vendorId
            && productId == other.productId;
    }
    bool operator!=(const DeviceRecord& other) const { return !(*this == other); }
};

/**
 * @brief Platform record of a sensed proximity tag
 *
 * The native target is opaque to the core; only the backend that produced
 * the record knows how to turn it into a session.
 */
struct ProximityTag {
    QByteArray uid;
    ProximityTechnologies technologies;
    QPointer<QObject> native;
};

QDebug operator<<(QDebug debug, const DeviceRecord& record);
QDebug operator<<(QDebug debug, ConnectionState state);
QDebug operator<<(QDebug debug, SurfacePhase phase);

} // namespace HardwareKey

Q_DECLARE_METATYPE(HardwareKey::DeviceRecord)
Q_DECLARE_METATYPE(HardwareKey::ProximityTag)
Q_DECLARE_METATYPE(HardwareKey::ConnectionState)
