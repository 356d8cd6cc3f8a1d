#include <slink/Transport/WebSocketTransport.hpp>
#include <QDebug>
#include <QWebSocket>

namespace slink {

WebSocketTransport::WebSocketTransport(QObject* parent)
    : ITransport(parent)
{
}

WebSocketTransport::~WebSocketTransport()
{
    if (socket_) {
        disconnect(socket_, nullptr, this, nullptr);
        socket_->abort();
    }
}

void WebSocketTransport::setVerifyTls(bool verify)
{
    verifyTls_ = verify;
}

void WebSocketTransport::open(const QUrl& url)
{
    if (!socket_) {
        // Created lazily so the socket belongs to whichever thread runs the transport
        socket_ = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
        connectSocketSignals();
    }
    if (socket_->state() != QAbstractSocket::UnconnectedState)
        socket_->abort();

    qInfo() << "[WebSocketTransport] opening" << url.toString();
    socket_->open(url);
}

void WebSocketTransport::close()
{
    if (!socket_) return;
    if (socket_->state() == QAbstractSocket::ConnectedState) {
        socket_->close(QWebSocketProtocol::CloseCodeNormal);
    } else if (socket_->state() != QAbstractSocket::UnconnectedState) {
        socket_->abort();
    }
}

bool WebSocketTransport::sendText(const QString& text)
{
    if (!isConnected()) {
        qWarning() << "[WebSocketTransport] send DROPPED:" << text.size()
                   << "chars (socket state:" << (socket_ ? (int)socket_->state() : -1) << ")";
        return false;
    }
    return socket_->sendTextMessage(text) >= 0;
}

bool WebSocketTransport::isConnected() const
{
    return socket_ && socket_->state() == QAbstractSocket::ConnectedState;
}

ConnectResult WebSocketTransport::classify(QAbstractSocket::SocketError error)
{
    switch (error) {
    case QAbstractSocket::ConnectionRefusedError:
    case QAbstractSocket::RemoteHostClosedError:
        return ConnectResult::Refused;
    case QAbstractSocket::SocketTimeoutError:
        return ConnectResult::Timeout;
    case QAbstractSocket::SslHandshakeFailedError:
    case QAbstractSocket::SslInternalError:
    case QAbstractSocket::SslInvalidUserDataError:
        return ConnectResult::TlsError;
    default:
        return ConnectResult::Unreachable;
    }
}

void WebSocketTransport::connectSocketSignals()
{
    connect(socket_, &QWebSocket::connected, this, &WebSocketTransport::connected);
    connect(socket_, &QWebSocket::disconnected, this, &WebSocketTransport::disconnected);
    connect(socket_, &QWebSocket::textMessageReceived, this, &WebSocketTransport::textReceived);
    connect(socket_, &QWebSocket::binaryMessageReceived, this, &WebSocketTransport::binaryReceived);
    connect(socket_, &QWebSocket::errorOccurred, this, &WebSocketTransport::onSocketError);
#ifndef QT_NO_SSL
    connect(socket_, &QWebSocket::sslErrors, this, &WebSocketTransport::onSslErrors);
#endif
}

void WebSocketTransport::onSocketError(QAbstractSocket::SocketError error)
{
    const ConnectResult kind = classify(error);
    qWarning() << "[WebSocketTransport] socket error:" << socket_->errorString()
               << "classified as" << toString(kind);
    emit this->error(kind, socket_->errorString());
}

void WebSocketTransport::onSslErrors(const QList<QSslError>& errors)
{
#ifndef QT_NO_SSL
    if (!verifyTls_) {
        qDebug() << "[WebSocketTransport] ignoring" << errors.size()
                 << "TLS errors (verification disabled)";
        socket_->ignoreSslErrors();
        return;
    }
    QStringList reasons;
    for (const auto& e : errors)
        reasons << e.errorString();
    emit error(ConnectResult::TlsError, reasons.join("; "));
#else
    Q_UNUSED(errors)
#endif
}

} // namespace slink
