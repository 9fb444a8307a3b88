// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include <QTest>
#include "hardware-key-qt/capability_probe.h"
#include "mocks/mock_platform_backend.h"

using namespace HardwareKey;
using namespace HardwareKey::Test;

class TestCapabilityProbe : public QObject {
    Q_OBJECT

private slots:
    void testNullBackend() {
        CapabilityProbe probe(nullptr);
        QVERIFY(!probe.query());
    }

    void testQuery_data() {
        QTest::addColumn<bool>("wired");
        QTest::addColumn<bool>("nfcPresent");
        QTest::addColumn<bool>("nfcEnabled");
        QTest::addColumn<int>("expected");

        const int wired = int(ConnectionMethod::Wired);
        const int proximity = int(ConnectionMethod::Proximity);

        QTest::newRow("nothing") << false << false << false << 0;
        QTest::newRow("wired only") << true << false << false << wired;
        QTest::newRow("nfc off") << false << true << false << 0;
        QTest::newRow("nfc on") << false << true << true << proximity;
        QTest::newRow("both") << true << true << true << (wired | proximity);
    }

    void testQuery() {
        QFETCH(bool, wired);
        QFETCH(bool, nfcPresent);
        QFETCH(bool, nfcEnabled);
        QFETCH(int, expected);

        MockPlatformBackend backend;
        backend.setWiredHostMode(wired);
        backend.setProximitySupport(nfcPresent);
        backend.setProximityEnabled(nfcEnabled);

        CapabilityProbe probe(&backend);
        QCOMPARE(int(probe.query()), expected);
    }

    void testQueriesEveryTime() {
        MockPlatformBackend backend;
        backend.setWiredHostMode(false);
        backend.setProximitySupport(true);
        backend.setProximityEnabled(false);

        CapabilityProbe probe(&backend);
        QVERIFY(!probe.query());

        // User switches NFC on while the app runs
        backend.setProximityEnabled(true);
        QCOMPARE(int(probe.query()), int(ConnectionMethod::Proximity));
    }

    void testBackendDestroyedFirst() {
        auto* backend = new MockPlatformBackend();
        backend->setWiredHostMode(true);

        CapabilityProbe probe(backend);
        QCOMPARE(int(probe.query()), int(ConnectionMethod::Wired));

        delete backend;
        QVERIFY(!probe.query());
    }
};

QTEST_MAIN(TestCapabilityProbe)
#include "test_capability_probe.moc"
