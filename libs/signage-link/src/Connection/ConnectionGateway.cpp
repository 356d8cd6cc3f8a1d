#include <slink/Connection/ConnectionGateway.hpp>
#include <QDebug>
#include <QJsonDocument>
#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>

namespace slink {

ConnectionGateway::ConnectionGateway(ITransport* transport, const GatewayConfig& config,
                                     QObject* parent)
    : QObject(parent)
    , config_(config)
    , transport_(transport)
{
    qRegisterMetaType<slink::ConnectResult>();
    qRegisterMetaType<slink::ConnectionState>();
    qRegisterMetaType<slink::GatewayEvent>();

    handshakeTimer_.setSingleShot(true);
    connect(&handshakeTimer_, &QTimer::timeout, this, &ConnectionGateway::onHandshakeTimeout);

    // Cross-thread when the transport runs on the I/O thread; queued automatically
    connect(transport_, &ITransport::connected,
            this, &ConnectionGateway::onTransportConnected);
    connect(transport_, &ITransport::disconnected,
            this, &ConnectionGateway::onTransportDisconnected);
    connect(transport_, &ITransport::error,
            this, &ConnectionGateway::onTransportError);
    connect(transport_, &ITransport::textReceived,
            this, &ConnectionGateway::onTextReceived);
    connect(transport_, &ITransport::binaryReceived,
            this, &ConnectionGateway::onBinaryReceived);
}

ConnectionGateway::~ConnectionGateway()
{
    disconnect(transport_, nullptr, this, nullptr);
    connected_.store(false);
}

void ConnectionGateway::connectTo(const QUrl& url)
{
    if (connected_.load()) {
        qInfo() << "[ConnectionGateway] already connected to" << url_.toString();
        return;
    }
    if (connecting_) {
        qWarning() << "[ConnectionGateway] connect to" << url.toString()
                   << "ignored, handshake with" << url_.toString() << "in progress";
        return;
    }

    url_ = url;
    connecting_ = true;
    sessionOpen_ = false;
    if (!reconnecting_)
        setState(ConnectionState::Connecting);

    qInfo() << "[ConnectionGateway] connecting to" << url.toString();
    handshakeTimer_.start(config_.handshakeTimeoutMs);
    invokeOnTransport([t = transport_, url]() { t->open(url); });
}

SendResult ConnectionGateway::send(const QJsonObject& message)
{
    if (!connected_.load(std::memory_order_acquire))
        return SendResult::NotConnected;

    const QString text = QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact));

    QMutexLocker lock(&sendMutex_);
    if (!connected_.load(std::memory_order_acquire))
        return SendResult::NotConnected;

    bool written = false;
    if (QThread::currentThread() == transport_->thread()) {
        written = transport_->sendText(text);
    } else if (!QMetaObject::invokeMethod(transport_, [this, &text, &written]() {
                   written = transport_->sendText(text);
               }, Qt::BlockingQueuedConnection)) {
        qWarning() << "[ConnectionGateway] could not reach transport thread";
        return SendResult::TransportError;
    }

    if (!written) {
        qWarning() << "[ConnectionGateway] send failed for"
                   << message.value("Type").toString() << "to" << url_.toString();
        return SendResult::TransportError;
    }
    return SendResult::Sent;
}

void ConnectionGateway::close()
{
    handshakeTimer_.stop();
    const bool wasActive = connecting_ || sessionOpen_;
    const bool wasOpen = sessionOpen_;

    connecting_ = false;
    sessionOpen_ = false;
    connected_.store(false, std::memory_order_release);

    if (wasOpen)
        closePending_ = true;
    invokeOnTransport([t = transport_]() { t->close(); });

    setState(reconnecting_ ? ConnectionState::Reconnecting : ConnectionState::Disconnected);
    reportClosed(wasActive ? QStringLiteral("closed locally") : QStringLiteral("already closed"));
}

ConnectionState ConnectionGateway::state() const
{
    QMutexLocker lock(&stateMutex_);
    return state_;
}

bool ConnectionGateway::isConnected() const
{
    return connected_.load(std::memory_order_acquire);
}

QUrl ConnectionGateway::url() const
{
    return url_;
}

void ConnectionGateway::setReconnecting(bool reconnecting)
{
    reconnecting_ = reconnecting;
    const ConnectionState current = state();
    if (current == ConnectionState::Connected)
        return;
    if (reconnecting)
        setState(ConnectionState::Reconnecting);
    else if (!connecting_)
        setState(ConnectionState::Disconnected);
    else
        setState(ConnectionState::Connecting);
}

void ConnectionGateway::setState(ConnectionState newState)
{
    {
        QMutexLocker lock(&stateMutex_);
        if (state_ == newState) return;
        state_ = newState;
    }
    qDebug() << "[ConnectionGateway] state ->" << toString(newState);
    emit stateChanged(newState);
}

void ConnectionGateway::finishConnect(ConnectResult result, const QString& detail)
{
    handshakeTimer_.stop();
    connecting_ = false;
    invokeOnTransport([t = transport_]() { t->close(); });

    qWarning() << "[ConnectionGateway] connect to" << url_.toString() << "failed:"
               << toString(result) << detail;
    setState(reconnecting_ ? ConnectionState::Reconnecting : ConnectionState::Disconnected);

    GatewayEvent ev;
    ev.kind = GatewayEvent::Kind::Errored;
    ev.error = result;
    ev.detail = detail;
    emit event(ev);
    emit connectFinished(result);
}

void ConnectionGateway::reportClosed(const QString& detail)
{
    qInfo() << "[ConnectionGateway] session with" << url_.toString() << "closed:" << detail;
    GatewayEvent ev;
    ev.kind = GatewayEvent::Kind::Closed;
    ev.detail = detail;
    emit event(ev);
}

void ConnectionGateway::invokeOnTransport(std::function<void()> fn)
{
    if (QThread::currentThread() == transport_->thread()) {
        fn();
        return;
    }
    if (!QMetaObject::invokeMethod(transport_, std::move(fn), Qt::QueuedConnection))
        qWarning() << "[ConnectionGateway] could not post to transport thread";
}

void ConnectionGateway::onTransportConnected()
{
    if (!connecting_) {
        // Late handshake after close() or a timeout; not wanted any more
        qDebug() << "[ConnectionGateway] dropping stale transport connect";
        invokeOnTransport([t = transport_]() { t->close(); });
        return;
    }

    handshakeTimer_.stop();
    connecting_ = false;
    sessionOpen_ = true;
    closePending_ = false;
    connected_.store(true, std::memory_order_release);
    setState(ConnectionState::Connected);

    qInfo() << "[ConnectionGateway] connected to" << url_.toString();
    emit connectFinished(ConnectResult::Ok);

    GatewayEvent ev;
    ev.kind = GatewayEvent::Kind::Opened;
    emit event(ev);
}

void ConnectionGateway::onTransportDisconnected()
{
    if (closePending_) {
        closePending_ = false;
        return;
    }
    if (connecting_) {
        finishConnect(ConnectResult::Refused, QStringLiteral("closed during handshake"));
        return;
    }
    if (!sessionOpen_)
        return;

    sessionOpen_ = false;
    connected_.store(false, std::memory_order_release);
    setState(reconnecting_ ? ConnectionState::Reconnecting : ConnectionState::Disconnected);
    reportClosed(QStringLiteral("remote closed"));
}

void ConnectionGateway::onTransportError(ConnectResult kind, const QString& message)
{
    if (connecting_) {
        finishConnect(kind, message);
        return;
    }
    if (!sessionOpen_) {
        qDebug() << "[ConnectionGateway] transport error with no session:" << message;
        return;
    }

    qWarning() << "[ConnectionGateway] transport error on open session:"
               << toString(kind) << message;
    GatewayEvent ev;
    ev.kind = GatewayEvent::Kind::Errored;
    ev.error = kind;
    ev.detail = message;
    emit event(ev);
}

void ConnectionGateway::onTextReceived(const QString& text)
{
    if (!sessionOpen_) return;
    dispatchDecoded(PayloadDecoder::decodeText(text));
}

void ConnectionGateway::onBinaryReceived(const QByteArray& data)
{
    if (!sessionOpen_) return;
    dispatchDecoded(PayloadDecoder::decodeBinary(data));
}

void ConnectionGateway::onHandshakeTimeout()
{
    if (!connecting_) return;
    finishConnect(ConnectResult::Timeout,
                  QStringLiteral("no handshake within %1 ms").arg(config_.handshakeTimeoutMs));
}

void ConnectionGateway::dispatchDecoded(const DecodeResult& decoded)
{
    if (!decoded.ok) {
        qWarning() << "[ConnectionGateway] protocol error, message dropped:" << decoded.error;
        return;
    }

    GatewayEvent ev;
    ev.kind = GatewayEvent::Kind::MessageReceived;
    ev.message = decoded.message;
    emit event(ev);
}

} // namespace slink
