#pragma once

#include "platform_backend.h"
#include <QMap>

namespace HardwareKey {

#ifdef HARDWARE_KEY_HAVE_PCSC
class PcscReaderMonitor;
#endif
class QtNfcTagListener;

/**
 * @brief Production platform backend
 *
 * Wired: PC/SC readers (desktop builds with HARDWARE_KEY_HAVE_PCSC).
 * Reader arrival/removal drives DeviceAttached/DeviceDetached. PC/SC has no
 * per-process access grant, so hasAccessGrant() is always true and a grant
 * prompt is answered "granted" on the next event loop iteration.
 *
 * Proximity: Qt NFC (Android, iOS, and wherever Qt NFC reports support).
 *
 * The reader monitor thread only runs while someone is registered for
 * DeviceAttached or DeviceDetached.
 */
class QtPlatformBackend : public PlatformBackend
{
    Q_OBJECT

public:
    explicit QtPlatformBackend(QObject* parent = nullptr);
    ~QtPlatformBackend() override;

    bool hasWiredHostMode() const override;
    bool hasProximitySupport() const override;
    bool isProximityEnabled() const override;

    QList<DeviceRecord> attachedDevices() const override;
    bool hasAccessGrant(const DeviceRecord& device) const override;
    void requestAccessGrant(const DeviceRecord& device) override;
    std::unique_ptr<DeviceSession> openDevice(const DeviceRecord& device) override;

    SubscriptionHandle registerObserver(NotificationKind kind, NotificationObserver* observer) override;
    bool unregisterObserver(const SubscriptionHandle& handle) override;

    SubscriptionHandle enableProximityListener(ProximityTechnology technology,
                                               NotificationObserver* observer) override;
    bool disableProximityListener(const SubscriptionHandle& handle) override;
    std::unique_ptr<DeviceSession> connectTag(const ProximityTag& tag) override;

    QString backendName() const override;

private slots:
    void onReaderAttached(const HardwareKey::DeviceRecord& device);
    void onReaderDetached(const HardwareKey::DeviceRecord& device);
    void onTagSensed(const HardwareKey::ProximityTag& tag);

private:
    struct Registration {
        NotificationKind kind;
        NotificationObserver* observer;
    };

    void dispatch(const PlatformEvent& event);
    void updateReaderMonitoring();

#ifdef HARDWARE_KEY_HAVE_PCSC
    PcscReaderMonitor* m_readerMonitor;
#endif
    QtNfcTagListener* m_tagListener;

    QMap<quint64, Registration> m_registrations;
    quint64 m_nextSubscriptionId;

    // Single foreground listener
    SubscriptionHandle m_proximityListener;
    NotificationObserver* m_proximityObserver;
    ProximityTechnology m_proximityTechnology;
};

} // namespace HardwareKey
