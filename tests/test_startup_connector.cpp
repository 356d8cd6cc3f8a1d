#include <QtTest/QtTest>
#include <QSignalSpy>
#include <slink/Connection/ConnectionGateway.hpp>
#include <slink/Transport/ScriptedTransport.hpp>
#include "core/connection/StartupConnector.hpp"

namespace {

const QUrl kServer("ws://10.0.0.5:8080/ws");

dsc::StartupSettings fastSettings()
{
    dsc::StartupSettings s;
    s.tickMs = 1;
    return s;
}

} // namespace

class TestStartupConnector : public QObject {
    Q_OBJECT
private slots:
    void testBackoffWithinBatch()
    {
        slink::ScriptedTransport transport;
        slink::ConnectionGateway gateway(&transport);
        dsc::StartupConnector connector(&gateway);

        QCOMPARE(connector.delayAfter(1), 2);
        QCOMPARE(connector.delayAfter(2), 4);
        QCOMPARE(connector.delayAfter(3), 8);
        QCOMPARE(connector.delayAfter(4), 16);
        QCOMPARE(connector.delayAfter(5), 32);
        QCOMPARE(connector.delayAfter(9), 32);
    }

    void testConnectsFirstTry()
    {
        slink::ScriptedTransport transport;
        transport.setNextResult(slink::ConnectResult::Ok);
        slink::ConnectionGateway gateway(&transport);
        dsc::StartupConnector connector(&gateway, fastSettings());
        connector.setTarget(kServer);
        QSignalSpy connectedSpy(&connector, &dsc::StartupConnector::connected);
        QSignalSpy waitSpy(&connector, &dsc::StartupConnector::waitScheduled);

        connector.start();
        QTRY_COMPARE(connectedSpy.count(), 1);
        QCOMPARE(waitSpy.count(), 0);
        QVERIFY(!connector.isRunning());
        QCOMPARE(transport.openedUrls(), QList<QUrl>({kServer}));
    }

    void testBatchesRepeatWithPause()
    {
        slink::ScriptedTransport transport;
        transport.setNextResult(slink::ConnectResult::Refused);
        slink::ConnectionGateway gateway(&transport);
        dsc::StartupConnector connector(&gateway, fastSettings());
        connector.setTarget(kServer);
        QSignalSpy waitSpy(&connector, &dsc::StartupConnector::waitScheduled);
        QSignalSpy batchSpy(&connector, &dsc::StartupConnector::batchFailed);
        QSignalSpy attemptSpy(&connector, &dsc::StartupConnector::attemptStarted);

        connector.start();
        QTRY_VERIFY_WITH_TIMEOUT(batchSpy.count() >= 2, 10000);
        connector.stop();

        QList<int> waits;
        for (int i = 0; i < 10; ++i)
            waits << waitSpy.at(i).at(0).toInt();
        QCOMPARE(waits, QList<int>({2, 4, 8, 16, 60, 2, 4, 8, 16, 60}));

        QCOMPARE(batchSpy.at(0).at(0).toInt(), 1);
        QCOMPARE(batchSpy.at(1).at(0).toInt(), 2);
        // attempt numbering restarts with every batch
        QCOMPARE(attemptSpy.at(5).at(0).toInt(), 2);
        QCOMPARE(attemptSpy.at(5).at(1).toInt(), 1);
    }

    void testConnectsInSecondBatch()
    {
        slink::ScriptedTransport transport;
        transport.setNextResult(slink::ConnectResult::Unreachable);
        slink::ConnectionGateway gateway(&transport);
        dsc::StartupConnector connector(&gateway, fastSettings());
        connector.setTarget(kServer);
        QSignalSpy connectedSpy(&connector, &dsc::StartupConnector::connected);
        connect(&connector, &dsc::StartupConnector::batchFailed,
                &transport, [&transport](int) { transport.setNextResult(slink::ConnectResult::Ok); });

        connector.start();
        QTRY_VERIFY_WITH_TIMEOUT(connectedSpy.count() == 1, 10000);
        QCOMPARE(connector.batch(), 2);
        QCOMPARE(connector.attemptInBatch(), 1);
        QCOMPARE(transport.openedUrls().size(), 6);
        QVERIFY(gateway.isConnected());
    }

    void testStopDuringWait()
    {
        slink::ScriptedTransport transport;
        transport.setNextResult(slink::ConnectResult::Refused);
        slink::ConnectionGateway gateway(&transport);
        dsc::StartupSettings settings;
        settings.tickMs = 100;
        dsc::StartupConnector connector(&gateway, settings);
        connector.setTarget(kServer);
        QSignalSpy waitSpy(&connector, &dsc::StartupConnector::waitScheduled);
        QSignalSpy stoppedSpy(&connector, &dsc::StartupConnector::stopped);

        connector.start();
        QTRY_COMPARE(waitSpy.count(), 1);
        connector.stop();

        QCOMPARE(stoppedSpy.count(), 1);
        QTest::qWait(300);
        QCOMPARE(transport.openedUrls().size(), 1);
    }
};

QTEST_MAIN(TestStartupConnector)
#include "test_startup_connector.moc"
