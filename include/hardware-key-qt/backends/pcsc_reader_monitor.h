#pragma once

#include "../device_session.h"
#include "../types.h"
#include <QAtomicInt>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QThread>
#include <memory>

namespace HardwareKey {

// Forward declaration to hide PC/SC types from MOC
struct PcscState;

/**
 * @brief Watches PC/SC smart card readers appear and disappear
 *
 * A USB security key with a CCID interface shows up as a PC/SC reader
 * (e.g. "Yubico YubiKey OTP+FIDO+CCID 00 00") while it is plugged in, so
 * reader arrival/removal is the wired attach/detach notification on desktop.
 *
 * Features:
 * - Event-driven monitoring on a worker thread via SCardGetStatusChange()
 *   on the PnP notification reader, with reader-list diffing
 * - Synchronous reader enumeration for the calling thread
 * - Opening a reader as a DeviceSession (T=0/T=1)
 *
 * Requirements:
 * - PC/SC daemon running (pcscd on Linux/macOS, built-in on Windows)
 */
class PcscReaderMonitor : public QObject
{
    Q_OBJECT

public:
    explicit PcscReaderMonitor(QObject* parent = nullptr);
    ~PcscReaderMonitor() override;

    /**
     * @brief Whether the PC/SC service can be reached
     */
    bool isServiceAvailable();

    /**
     * @brief Readers present right now
     */
    QList<DeviceRecord> readers();

    /**
     * @brief Start the monitoring thread; no-op if running
     *
     * The reader list is snapshotted on the calling thread before the
     * worker starts, so a reader that changes right after this returns is
     * still reported as attached or detached.
     */
    void startMonitoring();

    /**
     * @brief Stop the monitoring thread; no-op if not running
     */
    void stopMonitoring();

    bool isMonitoring() const { return m_monitorThread != nullptr; }

    /**
     * @brief Reader names the monitor currently diffs against
     */
    QSet<QString> knownReaders() const;

    /**
     * @brief Connect to the card in a reader
     * @return Session, or nullptr if the connection failed
     */
    std::unique_ptr<DeviceSession> open(const DeviceRecord& reader);

signals:
    /**
     * @brief Emitted (from the monitor thread) when a reader appears
     */
    void readerAttached(const HardwareKey::DeviceRecord& reader);

    /**
     * @brief Emitted (from the monitor thread) when a reader disappears
     */
    void readerDetached(const HardwareKey::DeviceRecord& reader);

private:
    /**
     * @brief Establish the PC/SC context used by the owning thread
     */
    void establishContext();

    /**
     * @brief Release the PC/SC context used by the owning thread
     */
    void releaseContext();

    /**
     * @brief Event-driven monitoring loop (runs in separate thread)
     */
    void monitorLoop();

    // PC/SC state (hidden via pimpl to avoid MOC issues with PC/SC types)
    PcscState* m_pcscState;

    QThread* m_monitorThread;
    QAtomicInt m_stopMonitoring;
    QMutex m_monitorContextMutex;  // guards PcscState::monitorContext
    QSet<QString> m_knownReaders;
    mutable QMutex m_knownReadersMutex;
};

} // namespace HardwareKey
