#include <QtTest/QtTest>
#include <QSignalSpy>
#include <slink/Connection/ConnectionGateway.hpp>
#include <slink/Connection/HeartbeatEmitter.hpp>
#include <slink/Protocol/Messages.hpp>
#include <slink/Transport/ScriptedTransport.hpp>

class TestHeartbeatEmitter : public QObject {
    Q_OBJECT
private slots:
    void testSendsImmediatelyThenPerInterval()
    {
        slink::ScriptedTransport transport;
        slink::ConnectionGateway gateway(&transport);
        transport.setNextResult(slink::ConnectResult::Ok);
        gateway.connectTo(QUrl("ws://host:8080/ws"));
        QTRY_VERIFY(gateway.isConnected());

        slink::HeartbeatEmitter heartbeat(&gateway);
        heartbeat.setTickMs(10);
        heartbeat.setIntervalSeconds(3);  // 3 ticks
        heartbeat.setPayloadProvider([]() {
            return slink::messages::heartbeat("c1", false, {}, {});
        });
        QSignalSpy sentSpy(&heartbeat, &slink::HeartbeatEmitter::heartbeatSent);

        heartbeat.start();
        QCOMPARE(sentSpy.count(), 1);

        QTRY_VERIFY(sentSpy.count() >= 3);
        heartbeat.stop();
        QVERIFY(!heartbeat.isRunning());

        const int countAtStop = sentSpy.count();
        QTest::qWait(100);
        QCOMPARE(sentSpy.count(), countAtStop);
        QVERIFY(transport.sentFrames().at(0).contains("\"HEARTBEAT\""));
    }

    void testFailureKeepsLoopAlive()
    {
        slink::ScriptedTransport transport;
        slink::ConnectionGateway gateway(&transport);  // never connected

        slink::HeartbeatEmitter heartbeat(&gateway);
        heartbeat.setTickMs(10);
        heartbeat.setIntervalSeconds(1);
        heartbeat.setPayloadProvider([]() {
            return slink::messages::heartbeat("c1", true, {}, {});
        });
        QSignalSpy failedSpy(&heartbeat, &slink::HeartbeatEmitter::heartbeatFailed);

        heartbeat.start();
        QTRY_VERIFY(failedSpy.count() >= 3);
        QVERIFY(heartbeat.isRunning());
        heartbeat.stop();
    }

    void testStopFromOtherThread()
    {
        slink::ScriptedTransport transport;
        slink::ConnectionGateway gateway(&transport);
        slink::HeartbeatEmitter heartbeat(&gateway);
        heartbeat.setTickMs(10);
        heartbeat.setPayloadProvider([]() { return QJsonObject{{"Type", "HEARTBEAT"}}; });
        heartbeat.start();

        QThread* stopper = QThread::create([&heartbeat]() { heartbeat.stop(); });
        stopper->start();
        stopper->wait();
        delete stopper;

        QVERIFY(!heartbeat.isRunning());
        QSignalSpy failedSpy(&heartbeat, &slink::HeartbeatEmitter::heartbeatFailed);
        QTest::qWait(50);
        QCOMPARE(failedSpy.count(), 0);
    }
};

QTEST_MAIN(TestHeartbeatEmitter)
#include "test_heartbeat_emitter.moc"
