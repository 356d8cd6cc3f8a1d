#include <QtTest/QtTest>
#include "core/discovery/AvahiDiscovery.hpp"

class TestAvahiTxt : public QObject {
    Q_OBJECT
private slots:
    void testParseTxt()
    {
        const auto props = dsc::AvahiDiscovery::parseTxt(
            {"Server_Name=Lobby Server", "endpoint=/ws", "flag", "=orphan", "empty="});
        QCOMPARE(props.value("server_name"), QString("Lobby Server"));
        QCOMPARE(props.value("endpoint"), QString("/ws"));
        QVERIFY(!props.contains("flag"));
        QVERIFY(props.contains("empty"));
        QVERIFY(props.value("empty").isEmpty());
        QCOMPARE(props.size(), 3);
    }

    void testFromResolvedUsesTxt()
    {
        const auto resolved = dsc::AvahiDiscovery::fromResolved(
            "signage-01", "192.168.0.20", 8443,
            {"server_name=HQ", "protocol=ws", "endpoint=/api/ws", "ssl_enabled=True"});
        QVERIFY(resolved);
        const auto& c = *resolved;
        QCOMPARE(c.name, QString("HQ"));
        QCOMPARE(c.source, QString("mdns"));
        QCOMPARE(c.endpointPath, QString("api/ws"));
        QVERIFY(c.sslEnabled);
        QCOMPARE(c.url(), QUrl("wss://192.168.0.20:8443/api/ws"));
    }

    void testFromResolvedDefaults()
    {
        const auto resolved = dsc::AvahiDiscovery::fromResolved("signage-01", "10.1.1.1", 0, {});
        QVERIFY(resolved);
        const auto& c = *resolved;
        QCOMPARE(c.name, QString("signage-01"));
        QCOMPARE(c.port, 8080);
        QCOMPARE(c.protocol, QString("ws"));
        QCOMPARE(c.endpointPath, QString("ws"));
        QVERIFY(!c.sslEnabled);
        QCOMPARE(c.url(), QUrl("ws://10.1.1.1:8080/ws"));
    }

    void testSslFlagSpellings()
    {
        for (const char* yes : {"ssl_enabled=1", "ssl_enabled=yes", "ssl_enabled=true"})
            QVERIFY(dsc::AvahiDiscovery::fromResolved("s", "1.2.3.4", 1, {yes})->sslEnabled);
        for (const char* no : {"ssl_enabled=0", "ssl_enabled=no", "ssl_enabled=false"})
            QVERIFY(!dsc::AvahiDiscovery::fromResolved("s", "1.2.3.4", 1, {no})->sslEnabled);
    }

    void testFromResolvedWithoutAddressSkipped()
    {
        QVERIFY(!dsc::AvahiDiscovery::fromResolved("signage-01", "", 8080, {"server_name=HQ"}));
        QVERIFY(!dsc::AvahiDiscovery::fromResolved("signage-01", "  ", 8080, {}));
    }

    void testNotRunningInitially()
    {
        dsc::AvahiDiscovery discovery;
        QCOMPARE(discovery.name(), QString("mdns"));
        QVERIFY(!discovery.isRunning());
    }
};

QTEST_MAIN(TestAvahiTxt)
#include "test_avahi_txt.moc"
