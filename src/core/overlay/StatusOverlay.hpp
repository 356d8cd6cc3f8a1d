#pragma once

#include <QMutex>
#include <QObject>
#include <QTimer>
#include "core/overlay/IOverlayRenderer.hpp"
#include "core/overlay/OverlayState.hpp"

namespace dsc {

/// Connectivity status overlay. Every transition runs check, update and
/// render under one lock, and repeated requests are throttled so the
/// screen does not flicker while the reconnection loop spins.
///
/// Redraw rules:
///  - a change of state renders, except between Connecting and
///    ServerOffline, which follow the attempt throttle below;
///  - identical parameters never render twice;
///  - Connecting / ServerOffline only redraw on attempt 1 and every 5th
///    attempt; within such an attempt the countdown redraws on its first
///    update, every 10th second and the final 3 seconds.
class StatusOverlay : public QObject {
    Q_OBJECT
public:
    explicit StatusOverlay(IOverlayRenderer* renderer, QObject* parent = nullptr);
    ~StatusOverlay() override;

    void setNoLayoutGraceMs(int ms);
    void setKeepOnTopIntervalMs(int ms);

    /// While suppressed every show* call is ignored; clear() still works.
    void setSuppressed(bool suppressed);
    bool isSuppressed() const;

    /// Shows this device's identity while searching; a changed identity
    /// redraws.
    void showAutoDiscovery(const QString& clientId, const QString& deviceAddress);
    void showConnecting(const QString& address, int attempt);
    /// Arms the no-layout grace window. The overlay appears only if no
    /// content is reported before the window closes.
    void showNoLayoutAssigned(const QString& address, const QString& clientId);
    /// Drops a pending no-layout window without touching what is on screen.
    void cancelNoLayoutAssigned();
    void showServerOffline(const QString& address, int attempt, int retryIn, bool discoveryActive);
    void clear();

    void notifyContentAssigned();
    /// Ends the startup phase; showAutoDiscovery is ignored afterwards.
    void markStartupComplete();

    OverlayState state() const;
    OverlayParams lastRendered() const;
    bool isNoLayoutGracePending() const;

    static bool isThrottledAttempt(int attempt);
    static bool isCountdownTick(int retryIn);

signals:
    void stateChanged(dsc::OverlayState state);

private:
    bool throttledLocked(const OverlayParams& next);
    void renderLocked(const OverlayParams& params);
    void onGraceExpired();
    void onKeepOnTop();

    IOverlayRenderer* renderer_;
    mutable QMutex mutex_;
    OverlayParams current_;
    int lastSeenAttempt_ = 0;
    bool suppressed_ = false;
    bool startupPhase_ = true;
    bool contentAssigned_ = false;
    bool noLayoutArmed_ = false;
    OverlayParams pendingNoLayout_;

    QTimer graceTimer_;
    QTimer keepOnTopTimer_;
};

} // namespace dsc
