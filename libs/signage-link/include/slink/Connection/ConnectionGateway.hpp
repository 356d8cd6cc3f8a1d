#pragma once

#include <QJsonObject>
#include <QMutex>
#include <QObject>
#include <QTimer>
#include <QUrl>
#include <atomic>
#include <functional>

#include <slink/Connection/ConnectionState.hpp>
#include <slink/Protocol/PayloadDecoder.hpp>
#include <slink/Transport/ITransport.hpp>

namespace slink {

/// Owns one transport session. All transport callbacks are turned into
/// GatewayEvent values on the gateway's thread.
///
/// send() may be called from any thread. Frames are written one at a time:
/// a lock-free connected flag short-circuits the offline case, then the
/// flag is re-checked under the send lock before the write. The transport
/// must not live on a thread that calls send() while other producers are
/// blocked on it.
class ConnectionGateway : public QObject {
    Q_OBJECT
public:
    ConnectionGateway(ITransport* transport, const GatewayConfig& config = {},
                      QObject* parent = nullptr);
    ~ConnectionGateway() override;

    /// Asynchronous. Result arrives through connectFinished() and, on
    /// success, an Opened event.
    void connectTo(const QUrl& url);
    SendResult send(const QJsonObject& message);
    /// Always reports Closed, with "already closed" when nothing was
    /// active. Repeated calls leave the gateway Disconnected.
    void close();

    ConnectionState state() const;
    bool isConnected() const;
    QUrl url() const;

    /// Set by the reconnection loop while it owns the session lifecycle.
    void setReconnecting(bool reconnecting);

signals:
    void event(const slink::GatewayEvent& ev);
    void connectFinished(slink::ConnectResult result);
    void stateChanged(slink::ConnectionState state);

private:
    void setState(ConnectionState newState);
    void finishConnect(ConnectResult result, const QString& detail);
    void reportClosed(const QString& detail);
    void invokeOnTransport(std::function<void()> fn);

    void onTransportConnected();
    void onTransportDisconnected();
    void onTransportError(ConnectResult kind, const QString& message);
    void onTextReceived(const QString& text);
    void onBinaryReceived(const QByteArray& data);
    void onHandshakeTimeout();
    void dispatchDecoded(const DecodeResult& decoded);

    GatewayConfig config_;
    ITransport* transport_;
    QUrl url_;

    mutable QMutex stateMutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    bool reconnecting_ = false;
    bool connecting_ = false;
    bool sessionOpen_ = false;
    bool closePending_ = false;

    std::atomic<bool> connected_{false};
    QMutex sendMutex_;

    QTimer handshakeTimer_;
};

} // namespace slink
