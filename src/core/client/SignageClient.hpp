#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <slink/Connection/ConnectionState.hpp>
#include "core/discovery/ServerCandidate.hpp"

namespace slink {
class ConnectionGateway;
class HeartbeatEmitter;
class OutboundMailbox;
}

namespace dsc {

class DiscoveryResolver;
class IConfigService;
class IDeviceInfoProvider;
class ILayoutCache;
class PresentationModeSelector;
class ReconnectionController;
class StartupConnector;
class StatusOverlay;
class YamlConfig;

/// Identity of this display as the server knows it.
struct ClientSession {
    QString clientId;
    QString registrationToken;
    QString assignedGroup;
    QString assignedLocation;
    bool registered = false;
};

/// Drives one display's connection to the signage server: startup
/// connection, registration, message dispatch and hand-off to the
/// reconnection loop when the session drops.
class SignageClient : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool online READ isOnline NOTIFY onlineChanged)

public:
    struct Components {
        slink::ConnectionGateway* gateway = nullptr;
        slink::OutboundMailbox* mailbox = nullptr;
        slink::HeartbeatEmitter* heartbeat = nullptr;
        StartupConnector* startup = nullptr;
        ReconnectionController* reconnect = nullptr;
        DiscoveryResolver* resolver = nullptr;          // optional
        StatusOverlay* overlay = nullptr;
        PresentationModeSelector* selector = nullptr;
        ILayoutCache* cache = nullptr;
        IDeviceInfoProvider* device = nullptr;
        YamlConfig* config = nullptr;
        IConfigService* configService = nullptr;
    };

    explicit SignageClient(const Components& components, QObject* parent = nullptr);

    /// Optional discovery, then the startup connection strategy.
    void start();
    /// Stops every loop and closes the session without reconnecting.
    void shutdown();

    /// Sends now when a session is open, otherwise queues for the next one.
    /// Returns true when the message went out immediately.
    bool sendOrQueue(const QJsonObject& message);
    bool sendStatusReport();
    bool sendScreenshot(const QByteArray& png);

    QJsonObject heartbeatPayload();

    const ClientSession& session() const { return session_; }
    bool isOnline() const { return online_; }
    bool isOfflineMode() const { return offlineMode_; }

signals:
    void onlineChanged(bool online);
    void registered(const QString& clientId);
    void registrationFailed(const QString& error);
    void layoutReceived(const QJsonObject& layout, const QJsonObject& data);
    void commandReceived(const QString& command, const QJsonObject& parameters);
    void offlineModeEntered();

private:
    void beginConnecting();
    void onStartupResolved(bool found, const ServerCandidate& candidate);
    void onStartupAttempt(int batch, int attempt);
    void onStartupWait(int seconds);
    void onStartupBatchFailed(int batch);

    void onGatewayEvent(const slink::GatewayEvent& ev);
    void onOpened();
    void onClosed(const QString& reason);
    void setOnline(bool online);

    void dispatch(const QJsonObject& message);
    void handleRegistrationResponse(const QJsonObject& message);
    void handleDisplayUpdate(const QJsonObject& message);
    void handleCommand(const QJsonObject& message);
    void handleHeartbeat();
    void handleUpdateConfig(const QJsonObject& message);

    void sendRegistration();
    QJsonObject cacheInfo() const;

    Components c_;
    ClientSession session_;
    bool online_ = false;
    bool offlineMode_ = false;
    bool offlineRecovery_ = false;
    bool startupDiscovering_ = false;
    bool shuttingDown_ = false;
};

} // namespace dsc
