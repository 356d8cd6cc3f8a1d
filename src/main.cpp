#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QHostAddress>
#include <QTextStream>
#include <QThread>
#include <QTimer>
#include <memory>

#include <slink/Connection/ConnectionGateway.hpp>
#include <slink/Connection/HeartbeatEmitter.hpp>
#include <slink/Connection/OutboundMailbox.hpp>
#include <slink/Connection/RetrySchedule.hpp>
#include <slink/Transport/WebSocketTransport.hpp>

#include "core/YamlConfig.hpp"
#include "core/cache/FileLayoutCache.hpp"
#include "core/client/SignageClient.hpp"
#include "core/connection/ReconnectionController.hpp"
#include "core/connection/StartupConnector.hpp"
#include "core/device/SystemDeviceInfo.hpp"
#include "core/discovery/AvahiDiscovery.hpp"
#include "core/discovery/BroadcastDiscovery.hpp"
#include "core/discovery/DiscoveryResolver.hpp"
#include "core/logging/Logging.hpp"
#include "core/logging/RemoteLogSink.hpp"
#include "core/overlay/PresentationModeSelector.hpp"
#include "core/overlay/StatusOverlay.hpp"
#include "core/services/ConfigService.hpp"
#include "core/system/WatchdogNotifier.hpp"
#include "ui/OverlayViewModel.hpp"

namespace {

void printCandidates(const QList<dsc::ServerCandidate>& candidates)
{
    QTextStream out(stdout);
    if (candidates.isEmpty()) {
        out << "No servers found\n";
        return;
    }
    out << "Found " << candidates.size() << " server(s):\n";
    for (const auto& c : candidates) {
        out << "  " << c.name << " [" << c.source << "]\n";
        for (const auto& url : c.urls())
            out << "    " << url.toString() << "\n";
        out << "    protocol " << c.protocol << ", ssl " << (c.sslEnabled ? "yes" : "no") << "\n";
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("digitalsignage-client");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("DigitalSignage");

    QCommandLineParser parser;
    parser.setApplicationDescription("Digital signage display client");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{"c", "config"}, "Configuration file.", "path",
                                    "/etc/digitalsignage/config.yaml");
    QCommandLineOption discoverOption("discover", "List servers on the local network and exit.");
    parser.addOption(configOption);
    parser.addOption(discoverOption);
    parser.process(app);

    // Load from the given path if it exists; otherwise built-in defaults
    const QString configPath = parser.value(configOption);
    dsc::YamlConfig yamlConfig;
    const bool configExists = QFile::exists(configPath);
    const bool configLoaded = configExists && yamlConfig.load(configPath);

    dsc::logging::Settings logSettings;
    logSettings.level = yamlConfig.logLevel();
    logSettings.file = yamlConfig.logFile();
    dsc::logging::init(logSettings);

    if (!configExists)
        qInfo() << "[Main] no config at" << configPath << "- using defaults";
    else if (!configLoaded)
        qWarning() << "[Main] could not parse" << configPath << "- using defaults";

    dsc::ConfigService configService(&yamlConfig, configPath);
    if (yamlConfig.ensureClientId() && !configService.save())
        qWarning() << "[Main] generated client id could not be saved to" << configPath;

    // --- Discovery (mDNS first, then UDP broadcast) ---
    auto* broadcast = new dsc::BroadcastDiscovery;
    broadcast->setTarget(QHostAddress::Broadcast, static_cast<quint16>(yamlConfig.broadcastPort()));
    auto* resolver = new dsc::DiscoveryResolver(
        {new dsc::AvahiDiscovery(yamlConfig.serviceType()), broadcast}, &app);
    resolver->setTimeoutMs(static_cast<int>(yamlConfig.discoveryTimeout() * 1000));

    if (parser.isSet(discoverOption)) {
        QObject::connect(resolver, &dsc::DiscoveryResolver::discoveredAll,
                         &app, [&app](const QList<dsc::ServerCandidate>& candidates) {
            printCandidates(candidates);
            app.exit(candidates.isEmpty() ? 1 : 0);
        });
        QTimer::singleShot(0, resolver, [resolver]() { resolver->discoverAll(); });
        return app.exec();
    }

    // --- Transport on its own I/O thread ---
    QThread ioThread;
    ioThread.setObjectName("SignageIO");
    auto transport = std::make_unique<slink::WebSocketTransport>();
    transport->setVerifyTls(yamlConfig.verifySsl());
    transport->moveToThread(&ioThread);
    ioThread.start();

    slink::ConnectionGateway gateway(transport.get());
    slink::OutboundMailbox mailbox;
    slink::HeartbeatEmitter heartbeat(&gateway);
    heartbeat.setIntervalSeconds(yamlConfig.heartbeatInterval());

    // --- Presentation ---
    dsc::FileLayoutCache cache(yamlConfig.cacheDir());
    dsc::OverlayViewModel overlayView;
    dsc::StatusOverlay overlay(&overlayView);
    overlay.setNoLayoutGraceMs(yamlConfig.noLayoutGraceSeconds() * 1000);
    dsc::PresentationModeSelector selector(&overlay, &cache,
                                           yamlConfig.showCachedLayoutOnDisconnect());

    // --- Connection policies ---
    dsc::ReconnectSettings reconnectSettings;
    reconnectSettings.schedule = slink::RetrySchedule(yamlConfig.reconnectSchedule());
    reconnectSettings.autoDiscover = yamlConfig.autoDiscover();
    dsc::ReconnectionController reconnect(&gateway, resolver, reconnectSettings);
    reconnect.setConfigService(&configService);
    reconnect.setOverlay(&overlay, &selector);
    dsc::StartupConnector startup(&gateway);

    dsc::SystemDeviceInfo device;

    dsc::SignageClient::Components components;
    components.gateway = &gateway;
    components.mailbox = &mailbox;
    components.heartbeat = &heartbeat;
    components.startup = &startup;
    components.reconnect = &reconnect;
    components.resolver = resolver;
    components.overlay = &overlay;
    components.selector = &selector;
    components.cache = &cache;
    components.device = &device;
    components.config = &yamlConfig;
    components.configService = &configService;
    dsc::SignageClient client(components);

    // --- systemd notify / watchdog ---
    dsc::WatchdogNotifier watchdog(dsc::WatchdogSettings::fromEnvironment());
    QObject::connect(&client, &dsc::SignageClient::onlineChanged,
                     &watchdog, &dsc::WatchdogNotifier::onOnlineChanged);
    QObject::connect(&client, &dsc::SignageClient::offlineModeEntered,
                     &watchdog, &dsc::WatchdogNotifier::onOfflineModeEntered);
    watchdog.notifyStatus(QStringLiteral("Initializing"));
    watchdog.start();

    // --- Remote log shipping ---
    std::shared_ptr<dsc::logging::RemoteLogShipper> shipper;
    if (yamlConfig.remoteLoggingEnabled()) {
        dsc::logging::RemoteLogShipper::Settings shipSettings;
        shipSettings.batchSize = yamlConfig.remoteLogBatchSize();
        shipSettings.intervalMs = static_cast<int>(yamlConfig.remoteLogBatchInterval() * 1000);
        shipper = std::make_shared<dsc::logging::RemoteLogShipper>(
            [&gateway](const QJsonObject& msg) { return gateway.send(msg); },
            [&gateway]() { return gateway.isConnected(); },
            shipSettings);
        shipper->setClientId(client.session().clientId);
        QObject::connect(&client, &dsc::SignageClient::registered,
                         &app, [shipper](const QString& id) { shipper->setClientId(id); });
        if (!dsc::logging::addRemoteSink(shipper, yamlConfig.remoteLogLevel()))
            qWarning() << "[Main] unknown remote log level" << yamlConfig.remoteLogLevel();
        shipper->start();
    }

    QObject::connect(&configService, &dsc::ConfigService::configChanged,
                     &app, [](const QString& key, const QVariant& value) {
        if (key == QLatin1String("logging.level"))
            dsc::logging::setLevel(value.toString());
    });

    // Content and device commands are consumed by the renderer process
    QObject::connect(&client, &dsc::SignageClient::layoutReceived,
                     &app, [](const QJsonObject& layout, const QJsonObject&) {
        qInfo() << "[Main] layout ready:" << layout.value("Name").toString();
    });
    QObject::connect(&selector, &dsc::PresentationModeSelector::cachedContentRequested,
                     &app, [](const QJsonObject& layout, const QJsonObject&) {
        qInfo() << "[Main] showing cached layout:" << layout.value("Name").toString();
    });
    QObject::connect(&client, &dsc::SignageClient::commandReceived,
                     &app, [](const QString& command, const QJsonObject&) {
        qInfo() << "[Main] device command:" << command;
    });
    QObject::connect(&overlay, &dsc::StatusOverlay::stateChanged,
                     &app, [&overlayView](dsc::OverlayState) {
        qInfo() << "[Main] overlay:" << overlayView.title();
    });

    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(qApp, []() { QCoreApplication::quit(); }, Qt::QueuedConnection);
    });
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(qApp, []() { QCoreApplication::quit(); }, Qt::QueuedConnection);
    });

    QTimer::singleShot(0, &client, &dsc::SignageClient::start);
    int ret = app.exec();

    // Stop producers before the gateway and transport go away
    watchdog.notifyStopping();
    client.shutdown();
    if (shipper) {
        dsc::logging::removeRemoteSinks();
        shipper->stop();
    }
    ioThread.quit();
    ioThread.wait();

    return ret;
}
