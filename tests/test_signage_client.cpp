#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <slink/Connection/ConnectionGateway.hpp>
#include <slink/Connection/HeartbeatEmitter.hpp>
#include <slink/Connection/OutboundMailbox.hpp>
#include <slink/Transport/ScriptedTransport.hpp>
#include "core/YamlConfig.hpp"
#include "core/cache/FileLayoutCache.hpp"
#include "core/client/SignageClient.hpp"
#include "core/connection/ReconnectionController.hpp"
#include "core/connection/StartupConnector.hpp"
#include "core/device/IDeviceInfoProvider.hpp"
#include "core/overlay/PresentationModeSelector.hpp"
#include "core/overlay/StatusOverlay.hpp"
#include "core/services/ConfigService.hpp"

namespace {

class FakeDevice : public dsc::IDeviceInfoProvider {
public:
    QJsonObject deviceInfo() override { return {{"Hostname", "display-test"}, {"Model", "bench"}}; }
    QJsonObject heartbeatInfo() override { return {{"CpuUsage", 12.5}, {"Uptime", 300}}; }
    QString macAddress() const override { return QStringLiteral("AA:BB:CC:DD:EE:FF"); }
    QString ipAddress() const override { return QStringLiteral("192.168.1.77"); }
};

class NullRenderer : public dsc::IOverlayRenderer {
public:
    void render(const dsc::OverlayParams&) override {}
    void hide() override {}
    void raise() override {}
};

dsc::ReconnectSettings fastReconnect()
{
    dsc::ReconnectSettings s;
    s.schedule = slink::RetrySchedule(QList<int>{1});
    s.tickMs = 1;
    return s;
}

dsc::StartupSettings fastStartup()
{
    dsc::StartupSettings s;
    s.tickMs = 1;
    return s;
}

// Every collaborator of a SignageClient wired to a scripted transport
struct Harness {
    Harness()
        : configService(&yaml, dir.path() + "/config.yaml")
        , gateway(&transport)
        , heartbeat(&gateway)
        , cache(dir.path() + "/cache")
        , overlay(&renderer)
        , selector(&overlay, &cache, false)
        , reconnect(&gateway, nullptr, fastReconnect())
        , startup(&gateway, fastStartup())
    {
        yaml.setClientId("display-1");
        yaml.setServerHost("10.0.0.5");
        reconnect.setConfigService(&configService);
        reconnect.setOverlay(&overlay, &selector);

        dsc::SignageClient::Components c;
        c.gateway = &gateway;
        c.mailbox = &mailbox;
        c.heartbeat = &heartbeat;
        c.startup = &startup;
        c.reconnect = &reconnect;
        c.overlay = &overlay;
        c.selector = &selector;
        c.cache = &cache;
        c.device = &device;
        c.config = &yaml;
        c.configService = &configService;
        client = std::make_unique<dsc::SignageClient>(c);
    }

    ~Harness()
    {
        client->shutdown();
    }

    QStringList sentTypes() const
    {
        QStringList types;
        for (const auto& frame : transport.sentFrames())
            types << QJsonDocument::fromJson(frame.toUtf8()).object().value("Type").toString();
        return types;
    }

    QJsonObject lastSent() const
    {
        return QJsonDocument::fromJson(transport.sentFrames().last().toUtf8()).object();
    }

    QTemporaryDir dir;
    dsc::YamlConfig yaml;
    dsc::ConfigService configService;
    slink::ScriptedTransport transport;
    slink::ConnectionGateway gateway;
    slink::OutboundMailbox mailbox;
    slink::HeartbeatEmitter heartbeat;
    dsc::FileLayoutCache cache;
    NullRenderer renderer;
    dsc::StatusOverlay overlay;
    dsc::PresentationModeSelector selector;
    dsc::ReconnectionController reconnect;
    dsc::StartupConnector startup;
    FakeDevice device;
    std::unique_ptr<dsc::SignageClient> client;
};

void connectHarness(Harness& h)
{
    h.transport.setNextResult(slink::ConnectResult::Ok);
    h.client->start();
    QTRY_VERIFY(h.client->isOnline());
}

} // namespace

class TestSignageClient : public QObject {
    Q_OBJECT
private slots:
    void testRegistersOnConnect()
    {
        Harness h;
        connectHarness(h);

        QCOMPARE(h.transport.openedUrls(), QList<QUrl>({QUrl("ws://10.0.0.5:8080/ws")}));
        QCOMPARE(h.sentTypes(), QStringList({"REGISTER", "HEARTBEAT"}));

        const auto reg = QJsonDocument::fromJson(h.transport.sentFrames().first().toUtf8()).object();
        QCOMPARE(reg.value("ClientId").toString(), QString("display-1"));
        QCOMPARE(reg.value("MacAddress").toString(), QString("AA:BB:CC:DD:EE:FF"));
        QCOMPARE(reg.value("DeviceInfo").toObject().value("Hostname").toString(), QString("display-test"));
        QVERIFY(!reg.contains("RegistrationToken"));

        QCOMPARE(h.lastSent().value("Status").toString(), QString("Online"));
    }

    void testQueuedMessagesFlushedInOrder()
    {
        Harness h;
        for (int i = 0; i < 3; ++i)
            QVERIFY(!h.client->sendStatusReport());
        QCOMPARE(h.mailbox.size(), 3);

        connectHarness(h);
        QVERIFY(h.mailbox.isEmpty());
        QVERIFY(h.client->sendStatusReport());

        QCOMPARE(h.sentTypes(), QStringList({"REGISTER", "STATUS_REPORT", "STATUS_REPORT",
                                             "STATUS_REPORT", "HEARTBEAT", "STATUS_REPORT"}));
    }

    void testMalformedFrameDoesNotEndSession()
    {
        Harness h;
        connectHarness(h);
        QSignalSpy layoutSpy(h.client.get(), &dsc::SignageClient::layoutReceived);

        h.transport.feedText("{not json");
        h.transport.feedText(R"({"Type":"DISPLAY_UPDATE","Layout":{"Id":"l1","Name":"Lobby"},"Data":{"k":1}})");

        QTRY_COMPARE(layoutSpy.count(), 1);
        QVERIFY(h.client->isOnline());
        QCOMPARE(layoutSpy.at(0).at(0).toJsonObject().value("Name").toString(), QString("Lobby"));
    }

    void testRegistrationPersistsAssignedId()
    {
        Harness h;
        connectHarness(h);
        QSignalSpy registeredSpy(h.client.get(), &dsc::SignageClient::registered);

        h.transport.feedText(R"({"Type":"REGISTRATION_RESPONSE","Success":true,
            "AssignedClientId":"srv-42","AssignedGroup":"Lobby","AssignedLocation":"HQ"})");

        QTRY_COMPARE(registeredSpy.count(), 1);
        QCOMPARE(registeredSpy.at(0).at(0).toString(), QString("srv-42"));
        QCOMPARE(h.client->session().clientId, QString("srv-42"));
        QCOMPARE(h.client->session().assignedGroup, QString("Lobby"));
        QVERIFY(h.client->session().registered);
        QVERIFY(h.overlay.isNoLayoutGracePending());

        dsc::YamlConfig reloaded;
        QVERIFY(reloaded.load(h.dir.path() + "/config.yaml"));
        QCOMPARE(reloaded.clientId(), QString("srv-42"));
    }

    void testDropDuringNoLayoutWindowKeepsOfflineOverlay()
    {
        Harness h;
        h.overlay.setNoLayoutGraceMs(50);
        connectHarness(h);
        QSignalSpy registeredSpy(h.client.get(), &dsc::SignageClient::registered);

        h.transport.feedText(R"({"Type":"REGISTRATION_RESPONSE","Success":true})");
        QTRY_COMPARE(registeredSpy.count(), 1);
        QVERIFY(h.overlay.isNoLayoutGracePending());

        h.transport.setNextResult(slink::ConnectResult::Refused);
        h.transport.simulateDisconnect();
        QTRY_VERIFY(!h.overlay.isNoLayoutGracePending());

        QTest::qWait(200);
        QVERIFY(!h.client->isOnline());
        QVERIFY(h.overlay.state() != dsc::OverlayState::NoLayoutAssigned);
    }

    void testRegistrationRejected()
    {
        Harness h;
        connectHarness(h);
        QSignalSpy failedSpy(h.client.get(), &dsc::SignageClient::registrationFailed);

        h.transport.feedText(R"({"Type":"REGISTRATION_RESPONSE","Success":false,"ErrorMessage":"bad token"})");
        QTRY_COMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.at(0).at(0).toString(), QString("bad token"));
        QVERIFY(!h.client->session().registered);
    }

    void testDisplayUpdateIsCached()
    {
        Harness h;
        connectHarness(h);
        h.transport.feedText(R"({"Type":"REGISTRATION_RESPONSE","Success":true})");
        h.transport.feedText(R"({"Type":"DISPLAY_UPDATE","Layout":{"Id":"menu","Name":"Menu"}})");

        QTRY_VERIFY(h.cache.hasLayout());
        QCOMPARE(h.cache.currentLayoutId(), QString("menu"));
        QVERIFY(!h.overlay.isNoLayoutGracePending());
    }

    void testCommands()
    {
        Harness h;
        connectHarness(h);
        QSignalSpy commandSpy(h.client.get(), &dsc::SignageClient::commandReceived);
        h.transport.feedText(R"({"Type":"DISPLAY_UPDATE","Layout":{"Id":"menu"}})");
        QTRY_VERIFY(h.cache.hasLayout());

        h.transport.feedText(R"({"Type":"COMMAND","Command":"CLEAR_CACHE"})");
        QTRY_VERIFY(!h.cache.hasLayout());
        QCOMPARE(commandSpy.count(), 0);

        h.transport.feedText(R"({"Type":"COMMAND","Command":"SCREEN_OFF","Parameters":{"Delay":5}})");
        QTRY_COMPARE(commandSpy.count(), 1);
        QCOMPARE(commandSpy.at(0).at(0).toString(), QString("SCREEN_OFF"));
        QCOMPARE(commandSpy.at(0).at(1).toJsonObject().value("Delay").toInt(), 5);
    }

    void testServerHeartbeatAnswered()
    {
        Harness h;
        connectHarness(h);
        h.transport.clearSent();

        h.transport.feedText(R"({"Type":"HEARTBEAT"})");
        QTRY_COMPARE(h.sentTypes(), QStringList({"HEARTBEAT"}));
        QCOMPARE(h.lastSent().value("CacheInfo").toObject().value("LayoutCount").toInt(), 0);
        QCOMPARE(h.lastSent().value("DeviceInfo").toObject().value("Uptime").toInt(), 300);
    }

    void testUnknownTypeIgnored()
    {
        Harness h;
        connectHarness(h);
        h.transport.clearSent();

        h.transport.feedText(R"({"Type":"SOMETHING_NEW"})");
        QTest::qWait(50);
        QVERIFY(h.client->isOnline());
        QVERIFY(h.transport.sentFrames().isEmpty());
    }

    void testUpdateConfigApplied()
    {
        Harness h;
        connectHarness(h);
        h.transport.clearSent();

        h.transport.feedText(R"({"Type":"UPDATE_CONFIG","ShowCachedLayoutOnDisconnect":true,"LogLevel":"debug"})");
        QTRY_COMPARE(h.sentTypes(), QStringList({"UPDATE_CONFIG_RESPONSE"}));
        QVERIFY(h.lastSent().value("Success").toBool());
        QCOMPARE(h.yaml.logLevel(), QString("debug"));
        QCOMPARE(h.yaml.showCachedLayoutOnDisconnect(), true);
        // Same server, session stays up
        QCOMPARE(h.transport.openedUrls().size(), 1);
        QVERIFY(h.client->isOnline());
    }

    void testUpdateConfigRejectsWrongTypes()
    {
        Harness h;
        connectHarness(h);
        h.transport.clearSent();

        h.transport.feedText(R"({"Type":"UPDATE_CONFIG","ServerPort":"abc","UseSSL":"yes","LogLevel":"debug"})");
        QTRY_COMPARE(h.sentTypes(), QStringList({"UPDATE_CONFIG_RESPONSE"}));

        const QJsonObject ack = h.lastSent();
        QVERIFY(!ack.value("Success").toBool());
        QCOMPARE(ack.value("ErrorMessage").toString(), QString("rejected: ServerPort, UseSSL"));
        QCOMPARE(h.yaml.serverPort(), 8080);
        QCOMPARE(h.yaml.useSsl(), false);
        // Well-typed fields in the same update still apply
        QCOMPARE(h.yaml.logLevel(), QString("debug"));
        QCOMPARE(h.transport.openedUrls().size(), 1);
    }

    void testUpdateConfigNewServerReconnects()
    {
        Harness h;
        connectHarness(h);
        QSignalSpy reconnectedSpy(&h.reconnect, &dsc::ReconnectionController::reconnected);

        h.transport.feedText(R"({"Type":"UPDATE_CONFIG","ServerPort":9000})");
        QTRY_COMPARE(reconnectedSpy.count(), 1);

        QCOMPARE(h.transport.openedUrls().last(), QUrl("ws://10.0.0.5:9000/ws"));
        QTRY_VERIFY(h.client->isOnline());
    }

    void testDropStartsReconnection()
    {
        Harness h;
        connectHarness(h);
        QSignalSpy onlineSpy(h.client.get(), &dsc::SignageClient::onlineChanged);
        QSignalSpy reconnectedSpy(&h.reconnect, &dsc::ReconnectionController::reconnected);
        h.transport.clearSent();

        h.transport.simulateDisconnect();
        QTRY_COMPARE(reconnectedSpy.count(), 1);
        QTRY_VERIFY(h.client->isOnline());

        QCOMPARE(onlineSpy.count(), 2);
        QCOMPARE(h.sentTypes().first(), QString("REGISTER"));
        // First heartbeat after a drop tells the server we were offline
        const QStringList types = h.sentTypes();
        const int hb = types.indexOf("HEARTBEAT");
        QVERIFY(hb > 0);
        const auto beat = QJsonDocument::fromJson(h.transport.sentFrames().at(hb).toUtf8()).object();
        QCOMPARE(beat.value("Status").toString(), QString("OfflineRecovery"));
        QCOMPARE(h.client->heartbeatPayload().value("Status").toString(), QString("Online"));
    }

    void testOfflineModeAfterFirstBatch()
    {
        Harness h;
        QSignalSpy offlineSpy(h.client.get(), &dsc::SignageClient::offlineModeEntered);
        h.transport.setNextResult(slink::ConnectResult::Refused);

        h.client->start();
        QTRY_VERIFY_WITH_TIMEOUT(offlineSpy.count() == 1, 10000);
        QVERIFY(h.client->isOfflineMode());
        QCOMPARE(h.selector.mode(), dsc::PresentationModeSelector::Mode::Overlay);
        QVERIFY(h.startup.isRunning());

        // Server comes back while the startup loop keeps trying
        h.transport.setNextResult(slink::ConnectResult::Ok);
        QTRY_VERIFY_WITH_TIMEOUT(h.client->isOnline(), 10000);
        QVERIFY(!h.client->isOfflineMode());
    }

    void testShutdownDoesNotReconnect()
    {
        Harness h;
        connectHarness(h);
        QSignalSpy startedSpy(&h.reconnect, &dsc::ReconnectionController::started);

        h.client->shutdown();
        QTest::qWait(50);
        QVERIFY(!h.client->isOnline());
        QCOMPARE(startedSpy.count(), 0);
        QCOMPARE(h.transport.openedUrls().size(), 1);
    }

    void testEmptyScreenshotRejected()
    {
        Harness h;
        QVERIFY(!h.client->sendScreenshot({}));
        QVERIFY(h.mailbox.isEmpty());
        QVERIFY(!h.client->sendScreenshot("png-bytes"));
        QCOMPARE(h.mailbox.size(), 1);
    }
};

QTEST_MAIN(TestSignageClient)
#include "test_signage_client.moc"
