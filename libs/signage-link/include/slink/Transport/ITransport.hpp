#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QUrl>

#include <slink/Transport/ConnectResult.hpp>

namespace slink {

/// Message-oriented duplex transport. Implementations are driven from the
/// thread they live on; ConnectionGateway marshals calls onto that thread.
class ITransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ITransport() override = default;

    virtual void open(const QUrl& url) = 0;
    virtual void close() = 0;
    /// Returns false when the frame could not be handed to the socket.
    virtual bool sendText(const QString& text) = 0;
    virtual bool isConnected() const = 0;

signals:
    void connected();
    void disconnected();
    void textReceived(const QString& text);
    void binaryReceived(const QByteArray& data);
    void error(slink::ConnectResult kind, const QString& message);
};

} // namespace slink
