#pragma once

#include <QHostAddress>
#include <QTimer>
#include <optional>
#include "core/discovery/IDiscoveryMethod.hpp"

class QUdpSocket;

namespace dsc {

/// Sends DIGITALSIGNAGE_DISCOVER to the broadcast address and collects
/// DIGITALSIGNAGE_SERVER replies until the timeout.
class BroadcastDiscovery : public IDiscoveryMethod {
    Q_OBJECT
public:
    static constexpr quint16 kDefaultPort = 5555;
    static constexpr const char* kRequest = "DIGITALSIGNAGE_DISCOVER";
    static constexpr const char* kResponseType = "DIGITALSIGNAGE_SERVER";

    explicit BroadcastDiscovery(QObject* parent = nullptr);
    ~BroadcastDiscovery() override;

    void setTarget(const QHostAddress& address, quint16 port);

    QString name() const override { return QStringLiteral("broadcast"); }
    void start(int timeoutMs) override;
    void cancel() override;
    bool isRunning() const override { return running_; }

    /// nullopt for anything that is not a server response.
    static std::optional<ServerCandidate> parseResponse(const QByteArray& datagram,
                                                        const QHostAddress& sender);

private:
    void onReadyRead();
    void finish();
    void fail(const QString& reason);

    QHostAddress target_ = QHostAddress::Broadcast;
    quint16 port_ = kDefaultPort;
    QUdpSocket* socket_ = nullptr;
    QTimer timeout_;
    QList<ServerCandidate> found_;
    bool running_ = false;
};

} // namespace dsc
