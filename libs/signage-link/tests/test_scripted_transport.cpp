#include <QtTest/QtTest>
#include <QSignalSpy>
#include <slink/Transport/ScriptedTransport.hpp>

class TestScriptedTransport : public QObject {
    Q_OBJECT
private slots:
    void testFeedText()
    {
        slink::ScriptedTransport transport;
        QSignalSpy textSpy(&transport, &slink::ITransport::textReceived);

        transport.feedText("{\"Type\":\"HEARTBEAT\"}");

        QCOMPARE(textSpy.count(), 1);
        QCOMPARE(textSpy.at(0).at(0).toString(), QString("{\"Type\":\"HEARTBEAT\"}"));
    }

    void testSendRequiresConnection()
    {
        slink::ScriptedTransport transport;
        QVERIFY(!transport.sendText("dropped"));

        transport.simulateConnect();
        QVERIFY(transport.sendText("first"));
        QVERIFY(transport.sendText("second"));

        QCOMPARE(transport.sentFrames(), QStringList({"first", "second"}));

        transport.clearSent();
        QVERIFY(transport.sentFrames().isEmpty());
    }

    void testScriptedOpenSucceeds()
    {
        slink::ScriptedTransport transport;
        QSignalSpy connectedSpy(&transport, &slink::ITransport::connected);
        transport.setNextResult(slink::ConnectResult::Ok);

        transport.open(QUrl("ws://10.0.0.5:8080/ws"));
        QCOMPARE(connectedSpy.count(), 0);  // delivered asynchronously

        QTRY_COMPARE(connectedSpy.count(), 1);
        QVERIFY(transport.isConnected());
        QCOMPARE(transport.openedUrls().size(), 1);
    }

    void testScriptedOpenFails()
    {
        slink::ScriptedTransport transport;
        QSignalSpy errorSpy(&transport, &slink::ITransport::error);
        transport.setNextResult(slink::ConnectResult::Refused);

        transport.open(QUrl("ws://10.0.0.5:8080/ws"));

        QTRY_COMPARE(errorSpy.count(), 1);
        QCOMPARE(errorSpy.at(0).at(0).value<slink::ConnectResult>(), slink::ConnectResult::Refused);
        QVERIFY(!transport.isConnected());
    }

    void testSimulateDisconnect()
    {
        slink::ScriptedTransport transport;
        QSignalSpy disconnectedSpy(&transport, &slink::ITransport::disconnected);

        transport.simulateConnect();
        transport.simulateDisconnect();
        QVERIFY(!transport.isConnected());
        QCOMPARE(disconnectedSpy.count(), 1);
    }
};

QTEST_MAIN(TestScriptedTransport)
#include "test_scripted_transport.moc"
