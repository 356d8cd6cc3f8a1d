#pragma once

#include <QObject>
#include <QTimer>
#include <QUrl>
#include <atomic>

#include <slink/Transport/ConnectResult.hpp>

namespace slink { class ConnectionGateway; }

namespace dsc {

struct StartupSettings {
    int attemptsPerBatch = 5;
    int initialDelaySeconds = 2;
    int maxDelaySeconds = 32;
    int batchPauseSeconds = 60;
    int tickMs = 1000;
};

/// First connection after process start. Runs batches of attempts with
/// doubling delays (2s, 4s, 8s, 16s, capped at 32s) and a fixed pause
/// between batches, until a session opens or stop() is called.
/// batchFailed() fires after every exhausted batch so the caller can fall
/// back to offline presentation while attempts continue.
class StartupConnector : public QObject {
    Q_OBJECT
public:
    StartupConnector(slink::ConnectionGateway* gateway, const StartupSettings& settings = {},
                     QObject* parent = nullptr);

    void setTarget(const QUrl& url);
    QUrl target() const { return target_; }

    void start();
    void stop();
    bool isRunning() const { return running_; }

    int batch() const { return batch_; }
    int attemptInBatch() const { return attemptInBatch_; }

    /// Delay after the given 1-based attempt within a batch.
    int delayAfter(int attemptInBatch) const;

signals:
    void attemptStarted(int batch, int attempt, const QUrl& url);
    void attemptFailed(int batch, int attempt, slink::ConnectResult cause);
    void waitScheduled(int seconds);
    void batchFailed(int batch);
    void connected();
    void stopped();

private:
    void nextAttempt();
    void onConnectFinished(slink::ConnectResult result);
    void scheduleWait(int seconds);
    void finish();

    slink::ConnectionGateway* gateway_;
    StartupSettings settings_;
    QUrl target_;
    bool running_ = false;
    bool connecting_ = false;
    std::atomic<bool> stopRequested_{false};
    int batch_ = 0;
    int attemptInBatch_ = 0;
    QTimer waitTimer_;
};

} // namespace dsc
