// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/backends/qt_nfc_tag_listener.h"
#include <QDebug>
#include <QMutex>
#include <QMutexLocker>
#include <QPointer>
#include <QThread>
#include <QVariant>
#include <stdexcept>

namespace HardwareKey {

namespace {

QString describe(QNearFieldTarget::Error error)
{
    switch (error) {
        case QNearFieldTarget::NoError:
            return "No error has occurred.";
        case QNearFieldTarget::UnknownError:
            return "An unidentified error occurred.";
        case QNearFieldTarget::UnsupportedError:
            return "The requested operation is unsupported by this near field target.";
        case QNearFieldTarget::TargetOutOfRangeError:
            return "The target is no longer within range.";
        case QNearFieldTarget::NoResponseError:
            return "The target did not respond.";
        case QNearFieldTarget::ChecksumMismatchError:
            return "The checksum has detected a corrupted response.";
        case QNearFieldTarget::InvalidParametersError:
            return "Invalid parameters were passed to a tag type specific function.";
        case QNearFieldTarget::ConnectionError:
            return "Failed to connect to the target.";
        case QNearFieldTarget::NdefReadError:
            return "Failed to read NDEF messages from the target.";
        case QNearFieldTarget::NdefWriteError:
            return "Failed to write NDEF messages to the target.";
        case QNearFieldTarget::CommandError:
            return "Failed to send a command to the target.";
        case QNearFieldTarget::TimeoutError:
            return "The request timed out.";
        case QNearFieldTarget::UnsupportedTargetError:
            return "The target is unsupported (missing entitlement or privacy settings?).";
    }
    return "Unknown error.";
}

/**
 * @brief ISO-DEP session over a Qt NFC target
 */
class QtNfcDeviceSession : public DeviceSession {
public:
    explicit QtNfcDeviceSession(QNearFieldTarget* target)
        : m_target(target)
        , m_uid(target->uid())
    {
    }

    QByteArray transmit(const QByteArray& apdu) override
    {
        QMutexLocker locker(&m_transmitMutex);
        qDebug() << "QtNfcDeviceSession: Transmitting APDU:" << apdu.toHex();

        QPointer<QNearFieldTarget> target = m_target;
        if (!target) {
            qWarning() << "QtNfcDeviceSession: Target is gone";
            throw std::runtime_error("Tag lost");
        }

        QNearFieldTarget::RequestId requestId;

        // Send command (cross-thread if needed)
        if (QThread::currentThread() == target->thread()) {
            requestId = target->sendCommand(apdu);
        } else {
            QNearFieldTarget* raw = target.data();
            bool invoked = QMetaObject::invokeMethod(raw,
                [raw, apdu, &requestId]() {
                    requestId = raw->sendCommand(apdu);
                }, Qt::BlockingQueuedConnection);

            if (!invoked) {
                qWarning() << "QtNfcDeviceSession: invokeMethod failed";
                throw std::runtime_error("Failed to invoke sendCommand");
            }
        }

        if (!requestId.isValid()) {
            throw std::runtime_error("sendCommand rejected the APDU");
        }

        // Returns false if the tag is lost or the request times out
        if (!target || !target->waitForRequestCompleted(requestId, 5000)) {
            qWarning() << "QtNfcDeviceSession: Request failed (tag lost or timeout)";
            if (!target) {
                throw std::runtime_error("Tag lost during transmission");
            }
            throw std::runtime_error("Transmit failed: timeout");
        }

        QVariant responseVariant = target->requestResponse(requestId);
        if (!responseVariant.isValid()) {
            qWarning() << "QtNfcDeviceSession: Invalid response from target";
            throw std::runtime_error("Invalid response from target");
        }

        QByteArray response = responseVariant.toByteArray();
        qDebug() << "QtNfcDeviceSession: Received response:" << response.toHex();
        return response;
    }

    bool isConnected() const override { return !m_target.isNull(); }
    ConnectionMethod connectionMethod() const override { return ConnectionMethod::Proximity; }
    QString description() const override { return QString("NFC tag %1").arg(QString(m_uid.toHex())); }

private:
    QPointer<QNearFieldTarget> m_target;
    QByteArray m_uid;
    QMutex m_transmitMutex;
};

} // namespace

QtNfcTagListener::QtNfcTagListener(QObject* parent)
    : QObject(parent)
    , m_manager(new QNearFieldManager(this))
    , m_active(false)
{
    qRegisterMetaType<ProximityTag>("HardwareKey::ProximityTag");

    connect(m_manager, &QNearFieldManager::targetDetected,
            this, &QtNfcTagListener::onTargetDetected);
    connect(m_manager, &QNearFieldManager::targetLost,
            this, &QtNfcTagListener::onTargetLost);
    connect(m_manager, &QNearFieldManager::targetDetectionStopped, this, [this]() {
        qDebug() << "QtNfcTagListener: Target detection stopped by the platform";
        m_active = false;
    });
}

QtNfcTagListener::~QtNfcTagListener()
{
    stop();
}

bool QtNfcTagListener::isSupported() const
{
    return m_manager->isSupported(QNearFieldTarget::TagTypeSpecificAccess);
}

bool QtNfcTagListener::isEnabled() const
{
    return m_manager->isEnabled();
}

bool QtNfcTagListener::start()
{
    if (m_active) {
        return true;
    }

    if (!isSupported()) {
        qWarning() << "QtNfcTagListener: NFC not supported on this platform";
        return false;
    }

    if (!isEnabled()) {
        qWarning() << "QtNfcTagListener: NFC is disabled";
        return false;
    }

    m_manager->setUserInformation("Hold your security key near the device.");
    m_active = m_manager->startTargetDetection(QNearFieldTarget::TagTypeSpecificAccess);
    if (!m_active) {
        qWarning() << "QtNfcTagListener: startTargetDetection() failed";
    } else {
        qDebug() << "QtNfcTagListener: Target detection started";
    }
    return m_active;
}

void QtNfcTagListener::stop()
{
    if (!m_active) {
        return;
    }
    qDebug() << "QtNfcTagListener: Stopping target detection";
    m_manager->stopTargetDetection();
    m_active = false;
}

std::unique_ptr<DeviceSession> QtNfcTagListener::openSession(const ProximityTag& tag)
{
    auto* target = qobject_cast<QNearFieldTarget*>(tag.native.data());
    if (!target) {
        qWarning() << "QtNfcTagListener: Tag" << tag.uid.toHex() << "is no longer in range";
        return nullptr;
    }

    if (!tag.technologies.testFlag(ProximityTechnology::IsoDep)) {
        qWarning() << "QtNfcTagListener: Tag" << tag.uid.toHex() << "does not speak ISO-DEP";
        return nullptr;
    }

    return std::make_unique<QtNfcDeviceSession>(target);
}

void QtNfcTagListener::onTargetDetected(QNearFieldTarget* target)
{
    if (!target) {
        return;
    }

    ProximityTag tag;
    tag.uid = target->uid();
    tag.technologies = technologiesOf(target);
    tag.native = target;

    qDebug() << "QtNfcTagListener: Target detected, uid:" << tag.uid.toHex()
             << "type:" << static_cast<int>(target->type());

    connect(target, &QNearFieldTarget::error, this,
            [](QNearFieldTarget::Error error, const QNearFieldTarget::RequestId&) {
        qWarning() << "QtNfcTagListener: Target error:" << describe(error);
    });

    emit tagSensed(tag);
}

void QtNfcTagListener::onTargetLost(QNearFieldTarget* target)
{
    qDebug() << "QtNfcTagListener: Target lost:" << target;
    if (target) {
        target->deleteLater();
    }
}

ProximityTechnologies QtNfcTagListener::technologiesOf(const QNearFieldTarget* target)
{
    ProximityTechnologies technologies;

    switch (target->type()) {
        case QNearFieldTarget::NfcTagType4:
            technologies |= ProximityTechnology::IsoDep;
            break;
        case QNearFieldTarget::NfcTagType4A:
            technologies |= ProximityTechnology::IsoDep;
            technologies |= ProximityTechnology::NfcA;
            break;
        case QNearFieldTarget::NfcTagType4B:
            technologies |= ProximityTechnology::IsoDep;
            technologies |= ProximityTechnology::NfcB;
            break;
        case QNearFieldTarget::NfcTagType1:
        case QNearFieldTarget::NfcTagType2:
            technologies |= ProximityTechnology::NfcA;
            break;
        case QNearFieldTarget::MifareTag:
            technologies |= ProximityTechnology::Mifare;
            technologies |= ProximityTechnology::NfcA;
            break;
        case QNearFieldTarget::NfcTagType3:
        case QNearFieldTarget::ProprietaryTag:
            break;
    }

    if (target->accessMethods().testFlag(QNearFieldTarget::NdefAccess)) {
        technologies |= ProximityTechnology::Ndef;
    }

    return technologies;
}

} // namespace HardwareKey
