// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include <QTest>
#include <QSignalSpy>
#include "hardware-key-qt/connection_coordinator.h"
#include "hardware-key-qt/dummy_device_session.h"
#include "mocks/mock_lifecycle_source.h"
#include "mocks/mock_platform_backend.h"
#include <stdexcept>

using namespace HardwareKey;
using namespace HardwareKey::Test;

/**
 * @brief Tests for ConnectionCoordinator
 *
 * These tests verify:
 * - Single-shot delivery of connect and unplug callbacks
 * - Wired grant protocol end to end through the mock notification bus
 * - Proximity arming tied to the resumed phase
 * - Wired/proximity race: the loser is disarmed before the callback runs
 * - Subscriptions never leak: at most one per kind, none after Destroyed
 * - Debug injection when no connection method exists
 */
class TestConnectionCoordinator : public QObject {
    Q_OBJECT

private:
    MockPlatformBackend* m_backend = nullptr;
    MockLifecycleSource* m_source = nullptr;
    ConnectionCoordinator* m_coordinator = nullptr;

    int m_connects = 0;
    int m_unplugs = 0;
    QString m_description;
    ConnectionMethod m_via = ConnectionMethod::None;

    const DeviceRecord m_key = MockPlatformBackend::yubiKey("/dev/bus/usb/001/004");
    const DeviceRecord m_keyboard = MockPlatformBackend::otherDevice("/dev/bus/usb/001/005");
    const ProximityTag m_nfcKey = MockPlatformBackend::tag(
        QByteArray::fromHex("04a1b2c3d4e5f6"), ProximityTechnology::IsoDep | ProximityTechnology::NfcA);

    ConnectCallback connectCallback() {
        return [this](std::unique_ptr<DeviceSession> session) {
            ++m_connects;
            m_description = session->description();
            m_via = session->connectionMethod();
        };
    }

    UnplugCallback unplugCallback() {
        return [this]() { ++m_unplugs; };
    }

    void enableWiredOnly() {
        m_backend->setWiredHostMode(true);
        m_backend->setProximitySupport(false);
    }

    void enableProximityOnly() {
        m_backend->setWiredHostMode(false);
        m_backend->setProximitySupport(true);
        m_backend->setProximityEnabled(true);
    }

    void enableBoth() {
        m_backend->setWiredHostMode(true);
        m_backend->setProximitySupport(true);
        m_backend->setProximityEnabled(true);
    }

    void disableAll() {
        m_backend->setWiredHostMode(false);
        m_backend->setProximitySupport(false);
        m_backend->setProximityEnabled(false);
    }

    void verifyNoDuplicateSubscriptions() {
        QVERIFY(m_backend->activeRegistrations(NotificationKind::DeviceAttached) <= 1);
        QVERIFY(m_backend->activeRegistrations(NotificationKind::GrantResponse) <= 1);
        QVERIFY(m_backend->activeRegistrations(NotificationKind::DeviceDetached) <= 1);
    }

private slots:
    void init() {
        m_backend = new MockPlatformBackend();
        m_source = new MockLifecycleSource();
        m_coordinator = new ConnectionCoordinator(m_backend, m_source);
        m_connects = 0;
        m_unplugs = 0;
        m_description.clear();
        m_via = ConnectionMethod::None;
    }

    void cleanup() {
        delete m_coordinator;  // owns backend and source
    }

    // ========================================================================
    // Construction
    // ========================================================================

    void testAdoptsInjectedCollaborators() {
        QCOMPARE(m_backend->parent(), m_coordinator);
        QCOMPARE(m_source->parent(), m_coordinator);
        QCOMPARE(m_coordinator->backend(), m_backend);
        QCOMPARE(m_coordinator->state(), ConnectionState::Idle);
        QVERIFY(!m_coordinator->isConnectPending());
        QVERIFY(!m_coordinator->isUnplugPending());
    }

    void testKeepsExistingParent() {
        QObject owner;
        auto* backend = new MockPlatformBackend(&owner);
        auto* source = new MockLifecycleSource(&owner);
        {
            ConnectionCoordinator coordinator(backend, source);
            QCOMPARE(backend->parent(), &owner);
            QCOMPARE(source->parent(), &owner);
        }
        QCOMPARE(source->observerCount(), 0);
    }

    void testBackendDestroyedBeforeCoordinator() {
        QObject owner;
        auto* backend = new MockPlatformBackend(&owner);
        backend->setWiredHostMode(true);
        ConnectionCoordinator coordinator(backend, new MockLifecycleSource());
        QCOMPARE(int(coordinator.supportedConnectionMethods()), int(ConnectionMethod::Wired));

        delete backend;
        QVERIFY(!coordinator.supportedConnectionMethods());
        QVERIFY(!coordinator.isWiredDevicePresent());

        // Nothing left to unplug from
        int unplugs = 0;
        coordinator.requestUnplugNotice([&unplugs]() { ++unplugs; });
        QCOMPARE(unplugs, 1);
    }

    void testSupportedConnectionMethods() {
        enableBoth();
        QCOMPARE(int(m_coordinator->supportedConnectionMethods()),
                 int(ConnectionMethod::Wired | ConnectionMethod::Proximity));
        disableAll();
        QVERIFY(!m_coordinator->supportedConnectionMethods());
    }

    void testNothingSubscribedWhenIdle() {
        enableBoth();
        m_source->bringToFront();
        QCOMPARE(m_backend->totalActiveRegistrations(), 0);
        QVERIFY(!m_backend->isProximityListening());
    }

    // ========================================================================
    // requestConnect: argument and re-entrancy rules
    // ========================================================================

    void testEmptyConnectCallbackThrows() {
        bool thrown = false;
        try {
            m_coordinator->requestConnect(ConnectCallback());
        } catch (const std::logic_error&) {
            thrown = true;
        }
        QVERIFY(thrown);
        QVERIFY(!m_coordinator->isConnectPending());
    }

    void testSecondConnectRequestThrows() {
        enableWiredOnly();
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        int secondCalls = 0;
        bool thrown = false;
        try {
            m_coordinator->requestConnect([&secondCalls](std::unique_ptr<DeviceSession>) { ++secondCalls; });
        } catch (const std::logic_error&) {
            thrown = true;
        }
        QVERIFY(thrown);
        verifyNoDuplicateSubscriptions();

        // First request is still the one that gets served
        m_backend->setAccessGranted(m_key, true);
        m_backend->plugIn(m_key);
        QCOMPARE(m_connects, 1);
        QCOMPARE(secondCalls, 0);
    }

    void testConnectFromInsideCallback() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_backend->setAccessGranted(m_key, true);
        m_source->bringToFront();

        bool thrown = false;
        m_coordinator->requestConnect([this, &thrown](std::unique_ptr<DeviceSession>) {
            ++m_connects;
            try {
                m_coordinator->requestConnect(connectCallback());
            } catch (const std::logic_error&) {
                thrown = true;
            }
        });

        // The nested request finds the granted key and connects at once
        QVERIFY(!thrown);
        QCOMPARE(m_connects, 2);
        QCOMPARE(m_coordinator->state(), ConnectionState::Connected);
        QVERIFY(!m_coordinator->isConnectPending());
        verifyNoDuplicateSubscriptions();
    }

    // ========================================================================
    // Wired connect
    // ========================================================================

    void testGrantedKeyConnectsImmediately() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_backend->setAccessGranted(m_key, true);
        m_source->bringToFront();

        m_coordinator->requestConnect(connectCallback());

        QCOMPARE(m_connects, 1);
        QCOMPARE(m_via, ConnectionMethod::Wired);
        QCOMPARE(m_description, m_key.path);
        QCOMPARE(m_coordinator->state(), ConnectionState::Connected);
        QCOMPARE(m_coordinator->connectedVia(), ConnectionMethod::Wired);
        QVERIFY(!m_coordinator->isConnectPending());
        QCOMPARE(m_backend->totalActiveRegistrations(), 0);
    }

    void testConnectAfterGrant() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();

        m_coordinator->requestConnect(connectCallback());
        QCOMPARE(m_connects, 0);
        QCOMPARE(m_backend->promptCount(), 1);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceAttached), 1);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::GrantResponse), 1);

        m_backend->answerPrompt(m_key, true);

        QCOMPARE(m_connects, 1);
        QCOMPARE(m_via, ConnectionMethod::Wired);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceAttached), 0);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::GrantResponse), 0);
    }

    void testDeniedGrantIsNotRetried() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        m_backend->answerPrompt(m_key, false);

        QCOMPARE(m_connects, 0);
        QCOMPARE(m_backend->promptCount(), 1);
        QVERIFY(m_coordinator->isConnectPending());
        QCOMPARE(m_coordinator->state(), ConnectionState::AwaitingConnect);
    }

    void testKeyPluggedInWhileWaiting() {
        enableWiredOnly();
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        m_backend->plugIn(m_key);
        QCOMPARE(m_backend->promptCount(), 1);
        QCOMPARE(m_connects, 0);

        m_backend->answerPrompt(m_key, true);
        QCOMPARE(m_connects, 1);
    }

    void testUnrecognizedDeviceNeverConnects() {
        enableWiredOnly();
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        m_backend->setAccessGranted(m_keyboard, true);
        m_backend->plugIn(m_keyboard);
        m_backend->answerPrompt(m_keyboard, true);

        QCOMPARE(m_connects, 0);
        QCOMPARE(m_backend->promptCount(), 0);
        QCOMPARE(m_backend->openCount(), 0);
    }

    void testGrantForRemovedKeyIgnored() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        m_backend->unplug(m_key);
        m_backend->answerPrompt(m_key, true);

        QCOMPARE(m_connects, 0);
        QCOMPARE(m_backend->openCount(), 0);
        QVERIFY(m_coordinator->isConnectPending());
    }

    void testOpenFailureKeepsWaiting() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_backend->setAccessGranted(m_key, true);
        m_backend->setOpenFails(true);
        m_source->bringToFront();

        m_coordinator->requestConnect(connectCallback());

        QCOMPARE(m_connects, 0);
        QVERIFY(m_coordinator->isConnectPending());
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceAttached), 1);
    }

    void testRequestBeforeStartArmsOnStart() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_backend->setAccessGranted(m_key, true);

        m_coordinator->requestConnect(connectCallback());
        QCOMPARE(m_connects, 0);
        QCOMPARE(m_backend->totalActiveRegistrations(), 0);

        m_source->emitPhase(SurfacePhase::Created);
        m_source->emitPhase(SurfacePhase::Started);
        QCOMPARE(m_connects, 1);
    }

    // ========================================================================
    // Proximity connect
    // ========================================================================

    void testProximityConnect() {
        enableProximityOnly();
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        QVERIFY(m_backend->isProximityListening());
        QCOMPARE(m_backend->listenerTechnology(), ProximityTechnology::IsoDep);
        QCOMPARE(m_backend->totalActiveRegistrations(), 0);

        m_backend->simulateTagSensed(m_nfcKey);

        QCOMPARE(m_connects, 1);
        QCOMPARE(m_via, ConnectionMethod::Proximity);
        QCOMPARE(m_coordinator->connectedVia(), ConnectionMethod::Proximity);
        QVERIFY(!m_backend->isProximityListening());
    }

    void testNonIsoDepTagIgnored() {
        enableProximityOnly();
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        m_backend->simulateTagSensed(MockPlatformBackend::tag(QByteArray::fromHex("0a0b0c0d"),
                                                              ProximityTechnology::Mifare | ProximityTechnology::NfcA));
        QCOMPARE(m_connects, 0);
        QVERIFY(m_backend->isProximityListening());
    }

    void testProximityFollowsResumedPhase() {
        enableBoth();
        m_coordinator->requestConnect(connectCallback());

        m_source->emitPhase(SurfacePhase::Created);
        m_source->emitPhase(SurfacePhase::Started);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceAttached), 1);
        QVERIFY(!m_backend->isProximityListening());

        m_source->emitPhase(SurfacePhase::Resumed);
        QVERIFY(m_backend->isProximityListening());

        m_source->emitPhase(SurfacePhase::Paused);
        QVERIFY(!m_backend->isProximityListening());
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceAttached), 1);

        m_source->emitPhase(SurfacePhase::Stopped);
        QCOMPARE(m_backend->totalActiveRegistrations(), 0);

        // Back in front: everything re-armed exactly once
        m_source->emitPhase(SurfacePhase::Started);
        m_source->emitPhase(SurfacePhase::Resumed);
        QVERIFY(m_backend->isProximityListening());
        QCOMPARE(m_backend->listenerEnableCount(), 2);
        verifyNoDuplicateSubscriptions();
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceAttached), 1);
    }

    void testStartedAgainDoesNotDuplicateSubscriptions() {
        enableWiredOnly();
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        for (int i = 0; i < 3; ++i) {
            m_source->sendToBack();
            m_source->emitPhase(SurfacePhase::Started);
            m_source->emitPhase(SurfacePhase::Resumed);
            verifyNoDuplicateSubscriptions();
        }
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::GrantResponse), 1);
    }

    // ========================================================================
    // Wired/proximity race
    // ========================================================================

    void testProximityWinsThenWiredGrantArrives() {
        enableBoth();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());
        QCOMPARE(m_backend->promptCount(), 1);

        m_backend->simulateTagSensed(m_nfcKey);
        QCOMPARE(m_connects, 1);
        QCOMPARE(m_via, ConnectionMethod::Proximity);

        // Wired loser was disarmed before the callback ran
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceAttached), 0);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::GrantResponse), 0);

        m_backend->answerPrompt(m_key, true);
        QCOMPARE(m_connects, 1);
        QCOMPARE(m_backend->openCount(), 0);
    }

    void testWiredWinsThenTagSensed() {
        enableBoth();
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        m_backend->setAccessGranted(m_key, true);
        m_backend->plugIn(m_key);
        QCOMPARE(m_connects, 1);
        QVERIFY(!m_backend->isProximityListening());

        QVERIFY(!m_backend->simulateTagSensed(m_nfcKey));
        QCOMPARE(m_connects, 1);
    }

    void testLoserDisarmedWhenCallbackRuns() {
        enableBoth();
        m_source->bringToFront();

        bool wiredArmedInCallback = true;
        m_coordinator->requestConnect([this, &wiredArmedInCallback](std::unique_ptr<DeviceSession>) {
            wiredArmedInCallback = m_coordinator->wiredChannelState().isArmed();
            ++m_connects;
        });

        m_backend->simulateTagSensed(m_nfcKey);
        QCOMPARE(m_connects, 1);
        QVERIFY(!wiredArmedInCallback);
    }

    // ========================================================================
    // Debug injection
    // ========================================================================

    void testDummyInjectedWithoutConnectionMethods() {
        disableAll();
        m_coordinator->setDebugInjectionEnabled(true);

        m_coordinator->requestConnect(connectCallback());

        // Synchronous, regardless of the surface phase
        QCOMPARE(m_connects, 1);
        QCOMPARE(m_via, ConnectionMethod::None);
        QCOMPARE(m_description, DummyDeviceSession().description());
        QCOMPARE(m_coordinator->state(), ConnectionState::Connected);
        QCOMPARE(m_backend->totalActiveRegistrations(), 0);
    }

    void testNoInjectionWhenDisabled() {
        disableAll();
        m_coordinator->setDebugInjectionEnabled(false);
        m_source->bringToFront();

        m_coordinator->requestConnect(connectCallback());

        QCOMPARE(m_connects, 0);
        QVERIFY(m_coordinator->isConnectPending());
        QCOMPARE(m_coordinator->state(), ConnectionState::AwaitingConnect);
    }

    void testNoInjectionWhenMethodExists() {
        enableWiredOnly();
        m_coordinator->setDebugInjectionEnabled(true);
        m_source->bringToFront();

        m_coordinator->requestConnect(connectCallback());
        QCOMPARE(m_connects, 0);
    }

    // ========================================================================
    // Unplug notice
    // ========================================================================

    void testUnplugWithoutWiredHostMode() {
        enableProximityOnly();
        m_source->bringToFront();

        m_coordinator->requestUnplugNotice(unplugCallback());

        QCOMPARE(m_unplugs, 1);
        QVERIFY(!m_coordinator->isUnplugPending());
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceDetached), 0);
    }

    void testUnplugWithNoKeyPresent() {
        enableWiredOnly();
        m_backend->plugIn(m_keyboard, false);
        m_source->bringToFront();

        m_coordinator->requestUnplugNotice(unplugCallback());

        QCOMPARE(m_unplugs, 1);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceDetached), 0);
    }

    void testEmptyUnplugCallbackThrows() {
        bool thrown = false;
        try {
            m_coordinator->requestUnplugNotice(UnplugCallback());
        } catch (const std::logic_error&) {
            thrown = true;
        }
        QVERIFY(thrown);
    }

    void testUnplugFiresOnce() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();

        m_coordinator->requestUnplugNotice(unplugCallback());
        QCOMPARE(m_unplugs, 0);
        QCOMPARE(m_coordinator->state(), ConnectionState::AwaitingUnplug);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceDetached), 1);

        m_backend->unplug(m_key);
        QCOMPARE(m_unplugs, 1);
        QCOMPARE(m_coordinator->state(), ConnectionState::Idle);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceDetached), 0);

        // A second detach report for the same key is not delivered again
        m_backend->simulateDetach(m_key);
        QCOMPARE(m_unplugs, 1);
    }

    void testUnrecognizedDetachIgnored() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_backend->plugIn(m_keyboard, false);
        m_source->bringToFront();
        m_coordinator->requestUnplugNotice(unplugCallback());

        m_backend->unplug(m_keyboard);
        QCOMPARE(m_unplugs, 0);
        QVERIFY(m_coordinator->isUnplugPending());
    }

    void testSecondUnplugRequestThrows() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();
        m_coordinator->requestUnplugNotice(unplugCallback());

        bool thrown = false;
        try {
            m_coordinator->requestUnplugNotice(unplugCallback());
        } catch (const std::logic_error&) {
            thrown = true;
        }
        QVERIFY(thrown);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceDetached), 1);
    }

    void testUnplugAfterWiredConnect() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_backend->setAccessGranted(m_key, true);
        m_source->bringToFront();

        m_coordinator->requestConnect(connectCallback());
        QCOMPARE(m_coordinator->state(), ConnectionState::Connected);

        m_coordinator->requestUnplugNotice(unplugCallback());
        QCOMPARE(m_coordinator->state(), ConnectionState::AwaitingUnplug);

        m_backend->unplug(m_key);
        QCOMPARE(m_unplugs, 1);
        QCOMPARE(m_coordinator->state(), ConnectionState::Idle);
        QCOMPARE(m_coordinator->connectedVia(), ConnectionMethod::None);
    }

    void testUnplugWhileStoppedDeliveredOnStart() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();
        m_coordinator->requestUnplugNotice(unplugCallback());

        m_source->sendToBack();
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceDetached), 0);

        // Removed while nobody was listening
        m_backend->unplug(m_key);
        QCOMPARE(m_unplugs, 0);

        m_source->emitPhase(SurfacePhase::Started);
        QCOMPARE(m_unplugs, 1);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceDetached), 0);
    }

    void testUnplugWatchRestoredOnStart() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();
        m_coordinator->requestUnplugNotice(unplugCallback());

        m_source->sendToBack();
        m_source->emitPhase(SurfacePhase::Started);
        QCOMPARE(m_unplugs, 0);
        QCOMPARE(m_backend->activeRegistrations(NotificationKind::DeviceDetached), 1);

        m_backend->unplug(m_key);
        QCOMPARE(m_unplugs, 1);
    }

    void testUnplugWhileConnectPending() {
        enableWiredOnly();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());
        m_coordinator->requestUnplugNotice(unplugCallback());
        QCOMPARE(m_coordinator->state(), ConnectionState::AwaitingConnect);

        m_backend->unplug(m_key);
        QCOMPARE(m_unplugs, 1);
        QCOMPARE(m_coordinator->state(), ConnectionState::AwaitingConnect);
        QVERIFY(m_coordinator->isConnectPending());
    }

    // ========================================================================
    // Destroyed
    // ========================================================================

    void testDestroyedReleasesEverything() {
        enableBoth();
        m_backend->plugIn(m_key, false);
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());
        m_coordinator->requestUnplugNotice(unplugCallback());
        QVERIFY(m_backend->totalActiveRegistrations() > 0);
        QVERIFY(m_backend->isProximityListening());

        m_source->sendToBack();
        m_source->emitPhase(SurfacePhase::Destroyed);

        QCOMPARE(m_backend->totalActiveRegistrations(), 0);
        QVERIFY(!m_backend->isProximityListening());
        QVERIFY(!m_coordinator->isConnectPending());
        QVERIFY(!m_coordinator->isUnplugPending());
        QCOMPARE(m_coordinator->state(), ConnectionState::Idle);
        QCOMPARE(m_source->observerCount(), 0);
        QCOMPARE(m_connects, 0);
        QCOMPARE(m_unplugs, 0);
        QCOMPARE(m_backend->failedUnregistrations(), 0);
    }

    void testDestroyedWhileResumed() {
        enableBoth();
        m_source->bringToFront();
        m_coordinator->requestConnect(connectCallback());

        m_source->emitPhase(SurfacePhase::Destroyed);

        QCOMPARE(m_backend->totalActiveRegistrations(), 0);
        QVERIFY(!m_backend->isProximityListening());
        QVERIFY(!m_coordinator->isConnectPending());
    }

    // ========================================================================
    // State signal
    // ========================================================================

    void testStateChangedSignal() {
        enableWiredOnly();
        m_source->bringToFront();
        QSignalSpy spy(m_coordinator, &ConnectionCoordinator::stateChanged);
        QVERIFY(spy.isValid());

        m_coordinator->requestConnect(connectCallback());
        m_backend->setAccessGranted(m_key, true);
        m_backend->plugIn(m_key);

        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy.at(0).at(0).value<ConnectionState>(), ConnectionState::AwaitingConnect);
        QCOMPARE(spy.at(1).at(0).value<ConnectionState>(), ConnectionState::Connected);
    }
};

QTEST_MAIN(TestConnectionCoordinator)
#include "test_connection_coordinator.moc"
