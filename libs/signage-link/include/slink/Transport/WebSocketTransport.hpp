#pragma once

#include <slink/Transport/ITransport.hpp>
#include <QAbstractSocket>
#include <QList>
#include <QSslError>

class QWebSocket;

namespace slink {

class WebSocketTransport : public ITransport {
    Q_OBJECT
public:
    explicit WebSocketTransport(QObject* parent = nullptr);
    ~WebSocketTransport() override;

    /// When false, certificate errors are ignored for wss:// sessions.
    void setVerifyTls(bool verify);

    void open(const QUrl& url) override;
    void close() override;
    bool sendText(const QString& text) override;
    bool isConnected() const override;

    static ConnectResult classify(QAbstractSocket::SocketError error);

private:
    void connectSocketSignals();
    void onSocketError(QAbstractSocket::SocketError error);
    void onSslErrors(const QList<QSslError>& errors);

    QWebSocket* socket_ = nullptr;
    bool verifyTls_ = true;
};

} // namespace slink
