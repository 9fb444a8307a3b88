// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/backends/pcsc_reader_monitor.h"
#include <QDebug>
#include <QMutexLocker>
#include <QSet>
#include <stdexcept>
#include <vector>
#include <cstring>

#ifdef Q_OS_WIN
#include <winscard.h>
#elif defined(Q_OS_LINUX)
// Linux PCSC headers define all types
#include <PCSC/winscard.h>
#include <PCSC/pcsclite.h>
#else
// macOS PCSC headers need manual type definitions
#include <PCSC/winscard.h>
#include <PCSC/pcsclite.h>

// macOS doesn't define these Windows-style types
typedef uint32_t DWORD;
typedef int32_t LONG;
typedef uint8_t BYTE;
typedef char* LPSTR;
typedef const uint8_t* LPCBYTE;
#endif

namespace HardwareKey {

// Pimpl structure to hide PC/SC types from MOC
struct PcscState {
    SCARDCONTEXT context = 0;         // owning thread
    bool contextEstablished = false;
    SCARDCONTEXT monitorContext = 0;  // monitor thread, cancelled from the owning thread
};

namespace {

QStringList listReaderNames(SCARDCONTEXT context)
{
    QStringList readers;

#ifdef Q_OS_WIN
    DWORD dwReaders = 0;
    LONG rv = SCardListReadersA(context, NULL, NULL, &dwReaders);
#else
    DWORD dwReaders = 0;
    LONG rv = SCardListReaders(context, NULL, NULL, &dwReaders);
#endif

    if (rv != SCARD_S_SUCCESS || dwReaders == 0) {
        return readers;
    }

    std::vector<char> buffer(dwReaders);
#ifdef Q_OS_WIN
    rv = SCardListReadersA(context, NULL, buffer.data(), &dwReaders);
#else
    rv = SCardListReaders(context, NULL, buffer.data(), &dwReaders);
#endif

    if (rv == SCARD_S_SUCCESS) {
        const char* reader = buffer.data();
        while (*reader) {
            readers.append(QString::fromUtf8(reader));
            reader += strlen(reader) + 1;
        }
    }

    return readers;
}

DeviceRecord recordForReader(const QString& readerName)
{
    DeviceRecord record;
    record.path = readerName;
    record.name = readerName;
    return record;
}

/**
 * @brief Card session on one PC/SC reader
 *
 * Owns its own context so it can be used from whichever thread the caller
 * hands it to.
 */
class PcscDeviceSession : public DeviceSession {
public:
    PcscDeviceSession(SCARDCONTEXT context, SCARDHANDLE cardHandle, DWORD protocol, const QString& readerName)
        : m_context(context)
        , m_cardHandle(cardHandle)
        , m_activeProtocol(protocol)
        , m_readerName(readerName)
    {
    }

    ~PcscDeviceSession() override
    {
        if (m_cardHandle) {
            SCardDisconnect(m_cardHandle, SCARD_LEAVE_CARD);
        }
        SCardReleaseContext(m_context);
        qDebug() << "PcscDeviceSession: Disconnected from" << m_readerName;
    }

    QByteArray transmit(const QByteArray& apdu) override
    {
        // Serialize APDU transmissions to prevent interleaved commands/responses
        QMutexLocker locker(&m_transmitMutex);

        if (!m_cardHandle) {
            throw std::runtime_error("Not connected to any card");
        }

        qDebug() << "PcscDeviceSession: Transmitting APDU:" << apdu.toHex();

        SCARD_IO_REQUEST pioSendPci;
        if (m_activeProtocol == SCARD_PROTOCOL_T0) {
            pioSendPci = *SCARD_PCI_T0;
        } else {
            pioSendPci = *SCARD_PCI_T1;
        }

        BYTE pbRecvBuffer[258];  // Max short APDU response
        DWORD dwRecvLength = sizeof(pbRecvBuffer);

        LONG rv = SCardTransmit(
            m_cardHandle,
            &pioSendPci,
            (LPCBYTE)apdu.constData(),
            apdu.size(),
            NULL,
            pbRecvBuffer,
            &dwRecvLength
        );

        if (rv != SCARD_S_SUCCESS) {
            QString msg = QString("SCardTransmit failed: 0x%1").arg(rv, 0, 16);
            qWarning() << "PcscDeviceSession:" << msg;
            if (rv == SCARD_W_REMOVED_CARD || rv == SCARD_E_NO_SMARTCARD || rv == SCARD_E_READER_UNAVAILABLE) {
                SCardDisconnect(m_cardHandle, SCARD_LEAVE_CARD);
                m_cardHandle = 0;
            }
            throw std::runtime_error(msg.toStdString());
        }

        QByteArray response((char*)pbRecvBuffer, dwRecvLength);
        qDebug() << "PcscDeviceSession: Received response:" << response.toHex();
        return response;
    }

    bool isConnected() const override { return m_cardHandle != 0; }
    ConnectionMethod connectionMethod() const override { return ConnectionMethod::Wired; }
    QString description() const override { return m_readerName; }

private:
    SCARDCONTEXT m_context;
    SCARDHANDLE m_cardHandle;
    DWORD m_activeProtocol;
    QString m_readerName;
    QMutex m_transmitMutex;
};

} // namespace

PcscReaderMonitor::PcscReaderMonitor(QObject* parent)
    : QObject(parent)
    , m_pcscState(new PcscState())
    , m_monitorThread(nullptr)
    , m_stopMonitoring(0)
{
    qRegisterMetaType<DeviceRecord>("HardwareKey::DeviceRecord");
}

PcscReaderMonitor::~PcscReaderMonitor()
{
    stopMonitoring();
    releaseContext();
    delete m_pcscState;
}

void PcscReaderMonitor::establishContext()
{
    if (m_pcscState->contextEstablished) {
        return;
    }

    LONG rv = SCardEstablishContext(SCARD_SCOPE_SYSTEM, NULL, NULL, &m_pcscState->context);

    if (rv != SCARD_S_SUCCESS) {
        qWarning() << "PcscReaderMonitor: Failed to establish PC/SC context:" << QString("0x%1").arg(rv, 0, 16);
        return;
    }

    m_pcscState->contextEstablished = true;
    qDebug() << "PcscReaderMonitor: PC/SC context established";
}

void PcscReaderMonitor::releaseContext()
{
    if (m_pcscState->contextEstablished && m_pcscState->context) {
        SCardReleaseContext(m_pcscState->context);
        m_pcscState->context = 0;
        m_pcscState->contextEstablished = false;
        qDebug() << "PcscReaderMonitor: PC/SC context released";
    }
}

bool PcscReaderMonitor::isServiceAvailable()
{
    establishContext();
    if (!m_pcscState->contextEstablished) {
        return false;
    }

    // pcscd may have been restarted since the context was established
    if (SCardIsValidContext(m_pcscState->context) != SCARD_S_SUCCESS) {
        qDebug() << "PcscReaderMonitor: Context no longer valid, re-establishing";
        m_pcscState->contextEstablished = false;
        m_pcscState->context = 0;
        establishContext();
    }
    return m_pcscState->contextEstablished;
}

QList<DeviceRecord> PcscReaderMonitor::readers()
{
    QList<DeviceRecord> records;
    if (!isServiceAvailable()) {
        return records;
    }

    const QStringList names = listReaderNames(m_pcscState->context);
    for (const QString& name : names) {
        records.append(recordForReader(name));
    }
    return records;
}

void PcscReaderMonitor::startMonitoring()
{
    if (m_monitorThread && m_monitorThread->isRunning()) {
        qDebug() << "PcscReaderMonitor: Monitoring already running";
        return;
    }

    // A worker that gave up (no PC/SC service) is replaced
    if (m_monitorThread) {
        m_monitorThread->wait();
        delete m_monitorThread;
        m_monitorThread = nullptr;
    }

    m_stopMonitoring = 0;

    // Baseline taken here, not in the worker: callers decide presence right
    // after this returns
    QSet<QString> initial;
    const QList<DeviceRecord> present = readers();
    for (const DeviceRecord& reader : present) {
        initial.insert(reader.path);
    }
    {
        QMutexLocker locker(&m_knownReadersMutex);
        m_knownReaders = initial;
    }
    qDebug() << "PcscReaderMonitor: Initial readers:" << initial.size();

    m_monitorThread = QThread::create([this]() {
        monitorLoop();
    });

    m_monitorThread->start();
    qDebug() << "PcscReaderMonitor: Monitor thread started";
}

QSet<QString> PcscReaderMonitor::knownReaders() const
{
    QMutexLocker locker(&m_knownReadersMutex);
    return m_knownReaders;
}

void PcscReaderMonitor::stopMonitoring()
{
    if (!m_monitorThread) {
        return;
    }

    qDebug() << "PcscReaderMonitor: Stopping reader monitoring";

    // Signal thread to stop and wake up a blocking SCardGetStatusChange()
    m_stopMonitoring = 1;
    {
        QMutexLocker locker(&m_monitorContextMutex);
        if (m_pcscState->monitorContext) {
            SCardCancel(m_pcscState->monitorContext);
        }
    }

    if (!m_monitorThread->wait(2000)) {
        qWarning() << "PcscReaderMonitor: Monitor thread did not stop in time, forcing termination";
        m_monitorThread->terminate();
        m_monitorThread->wait();
    }

    delete m_monitorThread;
    m_monitorThread = nullptr;

    qDebug() << "PcscReaderMonitor: Monitor thread stopped";
}

std::unique_ptr<DeviceSession> PcscReaderMonitor::open(const DeviceRecord& reader)
{
    SCARDCONTEXT context = 0;
    LONG rv = SCardEstablishContext(SCARD_SCOPE_SYSTEM, NULL, NULL, &context);
    if (rv != SCARD_S_SUCCESS) {
        qWarning() << "PcscReaderMonitor: Failed to establish session context:" << QString("0x%1").arg(rv, 0, 16);
        return nullptr;
    }

    qDebug() << "PcscReaderMonitor: Connecting to card in reader:" << reader.path;

    SCARDHANDLE cardHandle = 0;
    DWORD activeProtocol = 0;
    QByteArray readerBytes = reader.path.toUtf8();
#ifdef Q_OS_WIN
    rv = SCardConnectA(
#else
    rv = SCardConnect(
#endif
        context,
        readerBytes.constData(),
        SCARD_SHARE_EXCLUSIVE,
        SCARD_PROTOCOL_T0 | SCARD_PROTOCOL_T1,
        &cardHandle,
        &activeProtocol
    );

    if (rv != SCARD_S_SUCCESS) {
        qWarning() << "PcscReaderMonitor: Failed to connect to card:" << QString("0x%1").arg(rv, 0, 16);
        SCardReleaseContext(context);
        return nullptr;
    }

    qDebug() << "PcscReaderMonitor: Connected, protocol:" << (activeProtocol == SCARD_PROTOCOL_T0 ? "T=0" : "T=1");
    return std::make_unique<PcscDeviceSession>(context, cardHandle, activeProtocol, reader.path);
}

void PcscReaderMonitor::monitorLoop()
{
    SCARDCONTEXT context = 0;
    LONG rv = SCardEstablishContext(SCARD_SCOPE_SYSTEM, NULL, NULL, &context);
    if (rv != SCARD_S_SUCCESS) {
        qWarning() << "PcscReaderMonitor: Monitor thread could not establish context:" << QString("0x%1").arg(rv, 0, 16);
        return;
    }

    {
        QMutexLocker locker(&m_monitorContextMutex);
        m_pcscState->monitorContext = context;
    }

    QSet<QString> known = knownReaders();

    // PnP Notification reader reports reader topology changes
    QByteArray pnpReader("\\\\?PnP?\\Notification");
    SCARD_READERSTATE pnpRs;
    memset(&pnpRs, 0, sizeof(pnpRs));
    pnpRs.szReader = pnpReader.constData();
    pnpRs.dwCurrentState = SCARD_STATE_UNAWARE;

    while (m_stopMonitoring.loadAcquire() == 0) {
        // 500ms timeout: readers are also re-listed on timeout, for platforms without PnP
        rv = SCardGetStatusChange(context, 500, &pnpRs, 1);

        if (rv == SCARD_E_CANCELLED) {
            qDebug() << "PcscReaderMonitor: Monitoring cancelled";
            break;
        }

        if (rv == SCARD_S_SUCCESS) {
            pnpRs.dwCurrentState = pnpRs.dwEventState;
        } else if (rv != SCARD_E_TIMEOUT && rv != SCARD_E_NO_READERS_AVAILABLE) {
            qWarning() << "PcscReaderMonitor: SCardGetStatusChange error:" << QString("0x%1").arg(rv, 0, 16);
            QThread::msleep(500);  // Wait before retry
        }

        QSet<QString> current;
        for (const QString& name : listReaderNames(context)) {
            current.insert(name);
        }

        for (const QString& name : current) {
            if (!known.contains(name)) {
                qDebug() << "PcscReaderMonitor: Reader attached:" << name;
                emit readerAttached(recordForReader(name));
            }
        }
        for (const QString& name : known) {
            if (!current.contains(name)) {
                qDebug() << "PcscReaderMonitor: Reader detached:" << name;
                emit readerDetached(recordForReader(name));
            }
        }
        if (known != current) {
            known = current;
            QMutexLocker locker(&m_knownReadersMutex);
            m_knownReaders = known;
        }
    }

    {
        QMutexLocker locker(&m_monitorContextMutex);
        m_pcscState->monitorContext = 0;
    }
    SCardReleaseContext(context);
    qDebug() << "PcscReaderMonitor: Monitor loop exited";
}

} // namespace HardwareKey
