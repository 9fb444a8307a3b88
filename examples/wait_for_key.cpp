/**
 * Example: wait for a security key, talk to it, then wait for it to go away
 *
 * This works on:
 * - Desktop: YubiKey plugged in over USB (PC/SC reader)
 * - Mobile: YubiKey NEO/5 NFC tapped against the phone
 */

#include <QGuiApplication>
#include <QDebug>
#include "hardware-key-qt/connection_coordinator.h"
#include <stdexcept>

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    qDebug() << "=== Security Key Example ===";

    HardwareKey::ConnectionCoordinator coordinator;

    const HardwareKey::ConnectionMethods methods = coordinator.supportedConnectionMethods();
    qDebug() << "Wired:" << methods.testFlag(HardwareKey::ConnectionMethod::Wired)
             << "NFC:" << methods.testFlag(HardwareKey::ConnectionMethod::Proximity);
    qDebug() << "";

    QObject::connect(&coordinator, &HardwareKey::ConnectionCoordinator::stateChanged,
        [](HardwareKey::ConnectionState state) {
        qDebug() << "State:" << state;
    });

    qDebug() << "Please plug in or tap your security key...";
    coordinator.requestConnect([&](std::unique_ptr<HardwareKey::DeviceSession> session) {
        qDebug() << "✅ Security key connected:" << session->description();

        // SELECT the YubiKey OTP application
        try {
            const QByteArray response = session->transmit(QByteArray::fromHex("00a4040007a0000005272001"));
            qDebug() << "SELECT response:" << response.toHex();
        } catch (const std::exception& e) {
            qWarning() << "⚠️  Transmit failed:" << e.what();
        }

        // Release the card before waiting for the unplug
        session.reset();

        qDebug() << "Remove the security key to quit";
        coordinator.requestUnplugNotice([]() {
            qDebug() << "❌ Security key removed";
            // May run before app.exec()
            QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit, Qt::QueuedConnection);
        });
    });

    return app.exec();
}
