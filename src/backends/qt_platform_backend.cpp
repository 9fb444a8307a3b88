// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/backends/qt_platform_backend.h"
#include "hardware-key-qt/backends/qt_nfc_tag_listener.h"
#ifdef HARDWARE_KEY_HAVE_PCSC
#include "hardware-key-qt/backends/pcsc_reader_monitor.h"
#endif
#include <QDebug>
#include <QTimer>
#include <utility>

namespace HardwareKey {

QtPlatformBackend::QtPlatformBackend(QObject* parent)
    : PlatformBackend(parent)
#ifdef HARDWARE_KEY_HAVE_PCSC
    , m_readerMonitor(new PcscReaderMonitor(this))
#endif
    , m_tagListener(new QtNfcTagListener(this))
    , m_nextSubscriptionId(1)
    , m_proximityObserver(nullptr)
    , m_proximityTechnology(ProximityTechnology::None)
{
#ifdef HARDWARE_KEY_HAVE_PCSC
    // Monitor signals come from its worker thread: queued onto ours
    connect(m_readerMonitor, &PcscReaderMonitor::readerAttached,
            this, &QtPlatformBackend::onReaderAttached, Qt::QueuedConnection);
    connect(m_readerMonitor, &PcscReaderMonitor::readerDetached,
            this, &QtPlatformBackend::onReaderDetached, Qt::QueuedConnection);
#endif
    connect(m_tagListener, &QtNfcTagListener::tagSensed,
            this, &QtPlatformBackend::onTagSensed);

    qDebug() << "QtPlatformBackend: Created," << backendName();
}

QtPlatformBackend::~QtPlatformBackend()
{
#ifdef HARDWARE_KEY_HAVE_PCSC
    m_readerMonitor->stopMonitoring();
#endif
    m_tagListener->stop();
}

bool QtPlatformBackend::hasWiredHostMode() const
{
#ifdef HARDWARE_KEY_HAVE_PCSC
    return m_readerMonitor->isServiceAvailable();
#else
    return false;
#endif
}

bool QtPlatformBackend::hasProximitySupport() const
{
    return m_tagListener->isSupported();
}

bool QtPlatformBackend::isProximityEnabled() const
{
    return m_tagListener->isEnabled();
}

QList<DeviceRecord> QtPlatformBackend::attachedDevices() const
{
#ifdef HARDWARE_KEY_HAVE_PCSC
    return m_readerMonitor->readers();
#else
    return {};
#endif
}

bool QtPlatformBackend::hasAccessGrant(const DeviceRecord& device) const
{
    Q_UNUSED(device);
    // PC/SC readers are accessible to every process talking to the daemon
    return true;
}

void QtPlatformBackend::requestAccessGrant(const DeviceRecord& device)
{
    qDebug() << "QtPlatformBackend: Grant requested for" << device << ", answering granted";
    QTimer::singleShot(0, this, [this, device]() {
        dispatch(PlatformEvent::grantResponse(device, true));
    });
}

std::unique_ptr<DeviceSession> QtPlatformBackend::openDevice(const DeviceRecord& device)
{
#ifdef HARDWARE_KEY_HAVE_PCSC
    return m_readerMonitor->open(device);
#else
    qWarning() << "QtPlatformBackend: No wired backend, cannot open" << device;
    return nullptr;
#endif
}

SubscriptionHandle QtPlatformBackend::registerObserver(NotificationKind kind, NotificationObserver* observer)
{
    if (!observer) {
        qWarning() << "QtPlatformBackend: Refusing to register a null observer";
        return SubscriptionHandle();
    }

    if (kind == NotificationKind::DeviceSensed) {
        qWarning() << "QtPlatformBackend: DeviceSensed is delivered through enableProximityListener()";
        return SubscriptionHandle();
    }

    const quint64 id = m_nextSubscriptionId++;
    m_registrations.insert(id, Registration{kind, observer});
    qDebug() << "QtPlatformBackend: Registered observer for" << kind << "id:" << id;

    updateReaderMonitoring();
    return SubscriptionHandle(id, kind);
}

bool QtPlatformBackend::unregisterObserver(const SubscriptionHandle& handle)
{
    auto it = m_registrations.find(handle.id());
    if (!handle.isValid() || it == m_registrations.end()) {
        return false;
    }

    qDebug() << "QtPlatformBackend: Unregistered observer for" << it->kind << "id:" << handle.id();
    m_registrations.erase(it);

    updateReaderMonitoring();
    return true;
}

SubscriptionHandle QtPlatformBackend::enableProximityListener(ProximityTechnology technology,
                                                              NotificationObserver* observer)
{
    if (!observer) {
        return SubscriptionHandle();
    }

    if (m_proximityListener.isValid()) {
        qWarning() << "QtPlatformBackend: A proximity listener is already enabled";
        return SubscriptionHandle();
    }

    if (!m_tagListener->start()) {
        return SubscriptionHandle();
    }

    m_proximityListener = SubscriptionHandle(m_nextSubscriptionId++, NotificationKind::DeviceSensed);
    m_proximityObserver = observer;
    m_proximityTechnology = technology;
    return m_proximityListener;
}

bool QtPlatformBackend::disableProximityListener(const SubscriptionHandle& handle)
{
    if (!handle.isValid() || !(handle == m_proximityListener)) {
        return false;
    }

    m_tagListener->stop();
    m_proximityListener = SubscriptionHandle();
    m_proximityObserver = nullptr;
    m_proximityTechnology = ProximityTechnology::None;
    return true;
}

std::unique_ptr<DeviceSession> QtPlatformBackend::connectTag(const ProximityTag& tag)
{
    return m_tagListener->openSession(tag);
}

QString QtPlatformBackend::backendName() const
{
#ifdef HARDWARE_KEY_HAVE_PCSC
    return "Qt (PC/SC + Qt NFC)";
#else
    return "Qt (Qt NFC)";
#endif
}

void QtPlatformBackend::onReaderAttached(const DeviceRecord& device)
{
    dispatch(PlatformEvent::deviceAttached(device));
}

void QtPlatformBackend::onReaderDetached(const DeviceRecord& device)
{
    dispatch(PlatformEvent::deviceDetached(device));
}

void QtPlatformBackend::onTagSensed(const ProximityTag& tag)
{
    if (!m_proximityObserver) {
        qDebug() << "QtPlatformBackend: Tag sensed with no listener enabled, ignoring";
        return;
    }

    if (!tag.technologies.testFlag(m_proximityTechnology)) {
        qDebug() << "QtPlatformBackend: Tag" << tag.uid.toHex() << "filtered out by technology";
        return;
    }

    m_proximityObserver->onNotification(PlatformEvent::deviceSensed(tag));
}

void QtPlatformBackend::dispatch(const PlatformEvent& event)
{
    // Observers may unregister while being notified: snapshot the ids first
    const QList<quint64> ids = m_registrations.keys();
    for (quint64 id : ids) {
        auto it = m_registrations.constFind(id);
        if (it == m_registrations.constEnd() || it->kind != event.kind) {
            continue;
        }
        it->observer->onNotification(event);
    }
}

void QtPlatformBackend::updateReaderMonitoring()
{
#ifdef HARDWARE_KEY_HAVE_PCSC
    bool wanted = false;
    for (const Registration& registration : std::as_const(m_registrations)) {
        if (registration.kind == NotificationKind::DeviceAttached
            || registration.kind == NotificationKind::DeviceDetached) {
            wanted = true;
            break;
        }
    }

    if (wanted && !m_readerMonitor->isMonitoring()) {
        m_readerMonitor->startMonitoring();
    } else if (!wanted && m_readerMonitor->isMonitoring()) {
        m_readerMonitor->stopMonitoring();
    }
#endif
}

} // namespace HardwareKey
