#include "core/client/SignageClient.hpp"
#include "core/YamlConfig.hpp"
#include "core/cache/ILayoutCache.hpp"
#include "core/connection/ReconnectionController.hpp"
#include "core/connection/StartupConnector.hpp"
#include "core/device/IDeviceInfoProvider.hpp"
#include "core/discovery/DiscoveryResolver.hpp"
#include "core/overlay/PresentationModeSelector.hpp"
#include "core/overlay/StatusOverlay.hpp"
#include "core/services/IConfigService.hpp"
#include <slink/Connection/ConnectionGateway.hpp>
#include <slink/Connection/HeartbeatEmitter.hpp>
#include <slink/Connection/OutboundMailbox.hpp>
#include <slink/Protocol/Messages.hpp>
#include <QStringList>
#include <boost/log/trivial.hpp>

namespace dsc {

SignageClient::SignageClient(const Components& components, QObject* parent)
    : QObject(parent)
    , c_(components)
{
    session_.clientId = c_.config->clientId();
    session_.registrationToken = c_.config->registrationToken();

    c_.heartbeat->setPayloadProvider([this]() { return heartbeatPayload(); });

    connect(c_.gateway, &slink::ConnectionGateway::event,
            this, &SignageClient::onGatewayEvent);

    connect(c_.startup, &StartupConnector::attemptStarted,
            this, [this](int batch, int attempt, const QUrl&) { onStartupAttempt(batch, attempt); });
    connect(c_.startup, &StartupConnector::waitScheduled,
            this, &SignageClient::onStartupWait);
    connect(c_.startup, &StartupConnector::batchFailed,
            this, &SignageClient::onStartupBatchFailed);

    if (c_.resolver) {
        connect(c_.resolver, &DiscoveryResolver::resolved,
                this, &SignageClient::onStartupResolved);
    }
}

void SignageClient::start()
{
    shuttingDown_ = false;
    const QUrl url = c_.config->serverUrl();
    c_.reconnect->setTarget(url);

    BOOST_LOG_TRIVIAL(info) << "[SignageClient] starting as " << session_.clientId.toStdString();

    if (c_.config->autoDiscover() && c_.resolver) {
        c_.overlay->showAutoDiscovery(session_.clientId, c_.device->ipAddress());
        startupDiscovering_ = true;
        if (c_.resolver->resolve())
            return;
        startupDiscovering_ = false;
        BOOST_LOG_TRIVIAL(warning) << "[SignageClient] discovery busy, using configured server";
    }
    beginConnecting();
}

void SignageClient::shutdown()
{
    shuttingDown_ = true;
    startupDiscovering_ = false;
    if (c_.resolver)
        c_.resolver->cancel();
    c_.startup->stop();
    c_.reconnect->stop();
    c_.heartbeat->stop();
    c_.overlay->clear();
    c_.gateway->close();
    setOnline(false);
}

void SignageClient::beginConnecting()
{
    const QUrl url = c_.config->serverUrl();
    c_.reconnect->setTarget(url);
    c_.startup->setTarget(url);
    c_.startup->start();
}

void SignageClient::onStartupResolved(bool found, const ServerCandidate& candidate)
{
    if (!startupDiscovering_)
        return;
    startupDiscovering_ = false;

    if (found) {
        BOOST_LOG_TRIVIAL(info) << "[SignageClient] discovered server " << candidate.name.toStdString()
                                << " at " << candidate.url().toString().toStdString();
        if (c_.configService && !ReconnectionController::persistCandidate(*c_.configService, candidate))
            BOOST_LOG_TRIVIAL(warning) << "[SignageClient] could not persist discovered server";
    } else {
        BOOST_LOG_TRIVIAL(info) << "[SignageClient] no server discovered, using "
                                << c_.config->serverUrl().toString().toStdString();
    }
    if (!shuttingDown_)
        beginConnecting();
}

void SignageClient::onStartupAttempt(int batch, int attempt)
{
    Q_UNUSED(batch)
    if (c_.selector->overlayAllowed())
        c_.overlay->showConnecting(c_.startup->target().host(), attempt);
}

void SignageClient::onStartupWait(int seconds)
{
    if (c_.selector->overlayAllowed())
        c_.overlay->showServerOffline(c_.startup->target().host(), c_.startup->attemptInBatch(),
                                      seconds, false);
}

void SignageClient::onStartupBatchFailed(int batch)
{
    if (batch != 1 || offlineMode_)
        return;
    BOOST_LOG_TRIVIAL(warning) << "[SignageClient] starting in offline mode";
    offlineMode_ = true;
    offlineRecovery_ = true;
    c_.selector->onConnectionLost();
    emit offlineModeEntered();
}

void SignageClient::onGatewayEvent(const slink::GatewayEvent& ev)
{
    switch (ev.kind) {
    case slink::GatewayEvent::Kind::Opened:
        onOpened();
        break;
    case slink::GatewayEvent::Kind::MessageReceived:
        dispatch(ev.message);
        break;
    case slink::GatewayEvent::Kind::Errored:
        BOOST_LOG_TRIVIAL(debug) << "[SignageClient] connection error: " << slink::toString(ev.error)
                                 << " " << ev.detail.toStdString();
        break;
    case slink::GatewayEvent::Kind::Closed:
        onClosed(ev.detail);
        break;
    }
}

void SignageClient::onOpened()
{
    BOOST_LOG_TRIVIAL(info) << "[SignageClient] connected to "
                            << c_.gateway->url().toString().toStdString();
    offlineMode_ = false;
    session_.registered = false;
    c_.reconnect->setTarget(c_.gateway->url());
    setOnline(true);

    sendRegistration();
    const int flushed = c_.mailbox->flush(*c_.gateway);
    if (flushed > 0)
        BOOST_LOG_TRIVIAL(info) << "[SignageClient] delivered " << flushed << " queued message(s)";
    c_.heartbeat->start();
    offlineRecovery_ = false;
    c_.selector->onConnectionRestored();
}

void SignageClient::onClosed(const QString& reason)
{
    const bool wasOnline = online_;
    c_.heartbeat->stop();
    setOnline(false);
    if (!wasOnline || shuttingDown_)
        return;

    BOOST_LOG_TRIVIAL(warning) << "[SignageClient] disconnected from server (" << reason.toStdString()
                               << "), entering offline mode";
    offlineMode_ = true;
    offlineRecovery_ = true;
    session_.registered = false;
    c_.selector->onConnectionLost();
    c_.reconnect->start();
}

void SignageClient::setOnline(bool online)
{
    if (online_ == online)
        return;
    online_ = online;
    emit onlineChanged(online);
}

void SignageClient::sendRegistration()
{
    slink::RegistrationInfo info;
    info.clientId = session_.clientId;
    info.macAddress = c_.device->macAddress();
    info.ipAddress = c_.device->ipAddress();
    info.deviceInfo = c_.device->deviceInfo();
    info.registrationToken = session_.registrationToken;

    if (c_.gateway->send(slink::messages::registerClient(info)) != slink::SendResult::Sent) {
        BOOST_LOG_TRIVIAL(error) << "[SignageClient] failed to send registration";
        return;
    }
    BOOST_LOG_TRIVIAL(info) << "[SignageClient] registration sent"
                            << (session_.registrationToken.isEmpty() ? "" : " with token");
}

bool SignageClient::sendOrQueue(const QJsonObject& message)
{
    if (c_.gateway->isConnected() && c_.gateway->send(message) == slink::SendResult::Sent)
        return true;
    c_.mailbox->enqueue(message);
    return false;
}

bool SignageClient::sendStatusReport()
{
    return sendOrQueue(slink::messages::statusReport(session_.clientId, c_.device->deviceInfo(),
                                                     c_.cache->currentLayoutId()));
}

bool SignageClient::sendScreenshot(const QByteArray& png)
{
    if (png.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[SignageClient] empty screenshot not sent";
        return false;
    }
    return sendOrQueue(slink::messages::screenshot(session_.clientId, png));
}

QJsonObject SignageClient::cacheInfo() const
{
    QJsonObject info;
    info["LayoutCount"] = c_.cache->layoutCount();
    info["CurrentLayoutId"] = c_.cache->currentLayoutId();
    return info;
}

QJsonObject SignageClient::heartbeatPayload()
{
    return slink::messages::heartbeat(session_.clientId, offlineRecovery_,
                                      c_.device->heartbeatInfo(), cacheInfo());
}

void SignageClient::dispatch(const QJsonObject& message)
{
    const QString type = slink::messages::typeOf(message);
    BOOST_LOG_TRIVIAL(debug) << "[SignageClient] received " << type.toStdString();

    if (type == QLatin1String(slink::MessageType::RegistrationResponse))
        handleRegistrationResponse(message);
    else if (type == QLatin1String(slink::MessageType::DisplayUpdate))
        handleDisplayUpdate(message);
    else if (type == QLatin1String(slink::MessageType::Command))
        handleCommand(message);
    else if (type == QLatin1String(slink::MessageType::Heartbeat))
        handleHeartbeat();
    else if (type == QLatin1String(slink::MessageType::UpdateConfig))
        handleUpdateConfig(message);
    else
        BOOST_LOG_TRIVIAL(warning) << "[SignageClient] protocol error, unknown message type '"
                                   << type.toStdString() << "' dropped";
}

void SignageClient::handleRegistrationResponse(const QJsonObject& message)
{
    if (!message.value("Success").toBool()) {
        const QString error = message.value("ErrorMessage").toString();
        BOOST_LOG_TRIVIAL(error) << "[SignageClient] registration rejected: " << error.toStdString();
        emit registrationFailed(error);
        return;
    }

    const QString assignedId = message.value("AssignedClientId").toString();
    if (!assignedId.isEmpty() && assignedId != session_.clientId) {
        BOOST_LOG_TRIVIAL(info) << "[SignageClient] server assigned client id " << assignedId.toStdString();
        session_.clientId = assignedId;
        if (c_.configService) {
            if (!c_.configService->setValue("client.id", assignedId) || !c_.configService->save())
                BOOST_LOG_TRIVIAL(warning) << "[SignageClient] could not persist assigned client id";
        }
    }
    session_.assignedGroup = message.value("AssignedGroup").toString();
    session_.assignedLocation = message.value("AssignedLocation").toString();
    session_.registered = true;

    BOOST_LOG_TRIVIAL(info) << "[SignageClient] registered as " << session_.clientId.toStdString()
                            << " group '" << session_.assignedGroup.toStdString()
                            << "' location '" << session_.assignedLocation.toStdString() << "'";

    c_.overlay->showNoLayoutAssigned(c_.gateway->url().host(), session_.clientId);
    emit registered(session_.clientId);
}

void SignageClient::handleDisplayUpdate(const QJsonObject& message)
{
    const QJsonObject layout = message.value("Layout").toObject();
    if (layout.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[SignageClient] display update without layout dropped";
        return;
    }
    const QJsonObject data = message.value("Data").toObject();

    BOOST_LOG_TRIVIAL(info) << "[SignageClient] display update: layout "
                            << layout.value("Name").toString().toStdString();
    if (!c_.cache->saveLayout(layout, data, true))
        BOOST_LOG_TRIVIAL(warning) << "[SignageClient] layout could not be cached";

    c_.overlay->notifyContentAssigned();
    c_.overlay->clear();
    emit layoutReceived(layout, data);
}

void SignageClient::handleCommand(const QJsonObject& message)
{
    const QString command = message.value("Command").toString();
    const QJsonObject parameters = message.value("Parameters").toObject();
    BOOST_LOG_TRIVIAL(info) << "[SignageClient] command " << command.toStdString();

    if (command == QLatin1String("CLEAR_CACHE")) {
        if (!c_.cache->clear())
            BOOST_LOG_TRIVIAL(error) << "[SignageClient] failed to clear layout cache";
        return;
    }
    if (command.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[SignageClient] command message without command dropped";
        return;
    }
    emit commandReceived(command, parameters);
}

void SignageClient::handleHeartbeat()
{
    c_.heartbeat->sendNow();
}

void SignageClient::handleUpdateConfig(const QJsonObject& message)
{
    struct Mapping { const char* field; const char* key; };
    static const Mapping mappings[] = {
        {"ServerHost", "server.host"},
        {"ServerPort", "server.port"},
        {"EndpointPath", "server.endpoint_path"},
        {"UseSSL", "server.use_ssl"},
        {"VerifySSL", "server.verify_ssl"},
        {"AutoDiscover", "discovery.auto_discover"},
        {"ShowCachedLayoutOnDisconnect", "display.show_cached_layout_on_disconnect"},
        {"LogLevel", "logging.level"},
    };

    if (!c_.configService) {
        sendOrQueue(slink::messages::updateConfigResponse(session_.clientId, false,
                                                          QStringLiteral("configuration is read-only")));
        return;
    }

    const QUrl before = c_.config->serverUrl();
    QStringList rejected;
    for (const Mapping& m : mappings) {
        const QJsonValue v = message.value(QLatin1String(m.field));
        if (v.isUndefined() || v.isNull())
            continue;
        QVariant value = v.toVariant();
        if (v.isDouble())
            value = v.toInt();
        if (!c_.configService->setValue(QLatin1String(m.key), value))
            rejected << QLatin1String(m.field);
    }

    QString error;
    if (!rejected.isEmpty())
        error = QStringLiteral("rejected: %1").arg(rejected.join(", "));
    if (!c_.configService->save())
        error = error.isEmpty() ? QStringLiteral("failed to save configuration") : error;

    const bool success = error.isEmpty();
    BOOST_LOG_TRIVIAL(info) << "[SignageClient] configuration update "
                            << (success ? "applied" : "failed: " + error.toStdString());
    c_.selector->setShowCachedOnDisconnect(c_.config->showCachedLayoutOnDisconnect());
    c_.reconnect->setAutoDiscover(c_.config->autoDiscover());
    sendOrQueue(slink::messages::updateConfigResponse(session_.clientId, success, error));

    const QUrl after = c_.config->serverUrl();
    if (after != before) {
        BOOST_LOG_TRIVIAL(info) << "[SignageClient] server address changed to "
                                << after.toString().toStdString() << ", reconnecting";
        c_.reconnect->setTarget(after);
        c_.gateway->close();
    }
}

} // namespace dsc
