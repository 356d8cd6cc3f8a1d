#pragma once

#include <QJsonObject>
#include <QObject>
#include <QTimer>
#include <atomic>
#include <functional>

namespace slink {

class ConnectionGateway;

/// Sends a liveness message right after start() and then once per
/// interval. The loop polls a stop flag on every tick, so stop() takes
/// effect within one tick even when requested from another thread.
class HeartbeatEmitter : public QObject {
    Q_OBJECT
public:
    using PayloadProvider = std::function<QJsonObject()>;

    explicit HeartbeatEmitter(ConnectionGateway* gateway, QObject* parent = nullptr);

    void setPayloadProvider(PayloadProvider provider);
    void setIntervalSeconds(int seconds);
    /// Length of one poll tick; one second in production.
    void setTickMs(int ms);

    void start();
    void stop();
    bool isRunning() const;

    /// Sends one heartbeat immediately. Returns true when it went out.
    bool sendNow();

signals:
    void heartbeatSent();
    void heartbeatFailed();

private:
    void onTick();

    ConnectionGateway* gateway_;
    PayloadProvider provider_;
    int intervalSeconds_ = 30;
    int ticksElapsed_ = 0;
    std::atomic<bool> stopRequested_{true};
    QTimer tickTimer_;
};

} // namespace slink
