#pragma once

#include <QObject>
#include <QTimer>
#include <QUrl>
#include <atomic>

#include <slink/Connection/RetrySchedule.hpp>
#include <slink/Transport/ConnectResult.hpp>
#include "core/discovery/ServerCandidate.hpp"

namespace slink { class ConnectionGateway; }

namespace dsc {

class DiscoveryResolver;
class IConfigService;
class PresentationModeSelector;
class StatusOverlay;

struct ReconnectSettings {
    slink::RetrySchedule schedule;
    bool autoDiscover = false;
    /// One countdown step. Production uses one second.
    int tickMs = 1000;
};

/// Retry loop run after an unexpected disconnect. Attempt n connects, and
/// on failure waits schedule[n] seconds in one-tick steps before attempt
/// n+1. With auto-discovery on, attempts 1, 5, 10, 15, ... first scan the
/// network and switch to (and persist) whatever server answers; the other
/// attempts reuse the last known address. The loop never gives up on its
/// own; stop() or a successful connect ends it.
class ReconnectionController : public QObject {
    Q_OBJECT
public:
    enum class Phase { Idle, Discovering, Connecting, Waiting };
    Q_ENUM(Phase)

    ReconnectionController(slink::ConnectionGateway* gateway, DiscoveryResolver* resolver,
                           const ReconnectSettings& settings, QObject* parent = nullptr);

    void setTarget(const QUrl& url);
    QUrl target() const { return target_; }

    void setConfigService(IConfigService* config);
    void setOverlay(StatusOverlay* overlay, PresentationModeSelector* selector);
    void setAutoDiscover(bool enabled);

    /// No-op while already retrying.
    void start();
    /// Safe from any thread; honoured at the next tick at the latest.
    void stop();

    bool isRunning() const { return running_; }
    Phase phase() const { return phase_; }
    int attempt() const { return attempt_; }

    static bool isDiscoveryAttempt(int attempt);
    /// Writes the candidate's address into the server section and saves.
    static bool persistCandidate(IConfigService& config, const ServerCandidate& candidate);

signals:
    void started();
    void attemptStarted(int attempt, const QUrl& url, bool discovery);
    void attemptFailed(int attempt, slink::ConnectResult cause);
    void waitScheduled(int attempt, int seconds);
    void countdown(int attempt, int remainingSeconds);
    void discoveryStarted(int attempt);
    void reconnected(int attempt);
    void stopped();

private:
    void nextAttempt();
    void connectAttempt();
    void startWait();
    void onTick();
    void onConnectFinished(slink::ConnectResult result);
    void onResolved(bool found, const ServerCandidate& candidate);
    void applyCandidate(const ServerCandidate& candidate);
    void succeed();
    bool checkStop();
    void finishStopped();
    bool overlayAllowed() const;

    slink::ConnectionGateway* gateway_;
    DiscoveryResolver* resolver_;
    ReconnectSettings settings_;
    IConfigService* config_ = nullptr;
    StatusOverlay* overlay_ = nullptr;
    PresentationModeSelector* selector_ = nullptr;

    QUrl target_;
    bool running_ = false;
    std::atomic<bool> stopRequested_{false};
    Phase phase_ = Phase::Idle;
    int attempt_ = 0;
    int remaining_ = 0;
    QTimer tickTimer_;
};

} // namespace dsc
