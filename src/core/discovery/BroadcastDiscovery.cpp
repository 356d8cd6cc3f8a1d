#include "core/discovery/BroadcastDiscovery.hpp"
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkDatagram>
#include <QUdpSocket>

namespace dsc {

BroadcastDiscovery::BroadcastDiscovery(QObject* parent)
    : IDiscoveryMethod(parent)
{
    timeout_.setSingleShot(true);
    connect(&timeout_, &QTimer::timeout, this, &BroadcastDiscovery::finish);
}

BroadcastDiscovery::~BroadcastDiscovery()
{
    delete socket_;
}

void BroadcastDiscovery::setTarget(const QHostAddress& address, quint16 port)
{
    target_ = address;
    port_ = port;
}

void BroadcastDiscovery::start(int timeoutMs)
{
    if (running_) return;
    running_ = true;
    found_.clear();

    delete socket_;
    socket_ = new QUdpSocket(this);
    connect(socket_, &QUdpSocket::readyRead, this, &BroadcastDiscovery::onReadyRead);

    if (!socket_->bind(QHostAddress::AnyIPv4, 0)) {
        fail(QStringLiteral("bind failed: %1").arg(socket_->errorString()));
        return;
    }

    const QByteArray request(kRequest);
    if (socket_->writeDatagram(request, target_, port_) != request.size()) {
        fail(QStringLiteral("send to %1:%2 failed: %3")
                 .arg(target_.toString()).arg(port_).arg(socket_->errorString()));
        return;
    }

    qInfo() << "[BroadcastDiscovery] request sent to" << target_.toString() << "port" << port_
            << "waiting" << timeoutMs << "ms";
    timeout_.start(timeoutMs);
}

void BroadcastDiscovery::cancel()
{
    if (!running_) return;
    timeout_.stop();
    finish();
}

std::optional<ServerCandidate> BroadcastDiscovery::parseResponse(const QByteArray& datagram,
                                                                 const QHostAddress& sender)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(datagram, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return std::nullopt;

    const QJsonObject obj = doc.object();
    if (obj.value("Type").toString() != QLatin1String(kResponseType))
        return std::nullopt;

    ServerCandidate c;
    c.source = QStringLiteral("broadcast");
    c.name = obj.value("ServerName").toString(QStringLiteral("Unknown"));
    for (const auto& ip : obj.value("LocalIPs").toArray()) {
        if (!ip.toString().isEmpty())
            c.addresses << ip.toString();
    }
    if (c.addresses.isEmpty() && !sender.isNull()) {
        bool mapped = false;
        const QHostAddress v4(sender.toIPv4Address(&mapped));
        c.addresses << (mapped ? v4.toString() : sender.toString());
    }
    c.port = obj.value("Port").toInt(8080);
    c.protocol = obj.value("Protocol").toString(QStringLiteral("ws"));
    QString path = obj.value("EndpointPath").toString(QStringLiteral("ws"));
    while (path.startsWith('/'))
        path.remove(0, 1);
    c.endpointPath = path;
    c.sslEnabled = obj.value("SslEnabled").toBool(false);

    c.discoveredAt = QDateTime::fromString(obj.value("Timestamp").toString(), Qt::ISODate);
    if (!c.discoveredAt.isValid())
        c.discoveredAt = QDateTime::currentDateTimeUtc();
    return c;
}

void BroadcastDiscovery::onReadyRead()
{
    while (socket_ && socket_->hasPendingDatagrams()) {
        const QNetworkDatagram datagram = socket_->receiveDatagram();
        auto candidate = parseResponse(datagram.data(), datagram.senderAddress());
        if (!candidate) {
            qDebug() << "[BroadcastDiscovery] ignoring datagram from"
                     << datagram.senderAddress().toString();
            continue;
        }
        const int before = found_.size();
        mergeUniqueByName(found_, {*candidate});
        if (found_.size() > before) {
            qInfo() << "[BroadcastDiscovery] found" << candidate->name
                    << "at" << candidate->url().toString();
        }
    }
}

void BroadcastDiscovery::fail(const QString& reason)
{
    qWarning() << "[BroadcastDiscovery] scan aborted:" << reason;
    QMetaObject::invokeMethod(this, [this]() { finish(); }, Qt::QueuedConnection);
}

void BroadcastDiscovery::finish()
{
    if (!running_) return;
    running_ = false;
    if (socket_) {
        socket_->close();
        socket_->deleteLater();
        socket_ = nullptr;
    }
    qInfo() << "[BroadcastDiscovery] complete, found" << found_.size() << "server(s)";
    emit finished(found_);
}

} // namespace dsc
