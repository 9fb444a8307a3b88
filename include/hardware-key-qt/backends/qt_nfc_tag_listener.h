#pragma once

#include "../device_session.h"
#include "../types.h"
#include <QNearFieldManager>
#include <QNearFieldTarget>
#include <QObject>
#include <memory>

namespace HardwareKey {

/**
 * @brief Foreground NFC tag listener on top of Qt NFC
 *
 * Thin wrapper around QNearFieldManager target detection in
 * TagTypeSpecificAccess mode (raw APDUs, required for ISO-DEP).
 *
 * Platform notes:
 * - Android: detection must only be started while the activity is resumed.
 *   ConnectionCoordinator guarantees that through the surface lifecycle.
 * - iOS: starting detection presents the system NFC sheet.
 * - Desktop: Qt NFC usually reports no support; the PC/SC path covers
 *   contactless readers there.
 */
class QtNfcTagListener : public QObject
{
    Q_OBJECT

public:
    explicit QtNfcTagListener(QObject* parent = nullptr);
    ~QtNfcTagListener() override;

    /**
     * @brief Whether the device has an NFC adapter usable for raw APDUs
     */
    bool isSupported() const;

    /**
     * @brief Whether the NFC adapter is switched on
     */
    bool isEnabled() const;

    /**
     * @brief Start target detection
     * @return false if NFC is unsupported or disabled
     */
    bool start();

    /**
     * @brief Stop target detection; safe when not active
     */
    void stop();

    bool isActive() const { return m_active; }

    /**
     * @brief Open an ISO-DEP session on a sensed tag
     * @return Session, or nullptr if the tag is gone or not ISO-DEP
     */
    std::unique_ptr<DeviceSession> openSession(const ProximityTag& tag);

signals:
    void tagSensed(const HardwareKey::ProximityTag& tag);

private slots:
    void onTargetDetected(QNearFieldTarget* target);
    void onTargetLost(QNearFieldTarget* target);

private:
    static ProximityTechnologies technologiesOf(const QNearFieldTarget* target);

    QNearFieldManager* m_manager;
    bool m_active;
};

} // namespace HardwareKey
