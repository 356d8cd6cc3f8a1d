#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

namespace dsc {

struct WatchdogSettings {
    QString notifySocket;   // $NOTIFY_SOCKET; '@' prefix is the abstract namespace
    qint64 watchdogUsec = 0;
    qint64 watchdogPid = 0; // 0 = any process

    static WatchdogSettings fromEnvironment();
};

/// systemd service notifications (READY, WATCHDOG, STATUS, STOPPING) sent
/// as datagrams to the manager's notify socket. Without NOTIFY_SOCKET every
/// call is a no-op; without WATCHDOG_USEC no keep-alive pings are sent.
class WatchdogNotifier : public QObject {
    Q_OBJECT
public:
    explicit WatchdogNotifier(const WatchdogSettings& settings, QObject* parent = nullptr);

    bool isEnabled() const;
    bool isWatchdogActive() const;
    /// Half the manager's watchdog timeout, or 0 when no watchdog is set.
    int pingIntervalMs() const;

    void start();
    void stop();

    bool notifyReady();
    bool notifyStopping();
    bool notifyStatus(const QString& status);
    bool ping();

public slots:
    void onOnlineChanged(bool online);
    void onOfflineModeEntered();

private:
    bool send(const QByteArray& message);

    WatchdogSettings settings_;
    QTimer pingTimer_;
    bool readySent_ = false;
};

} // namespace dsc
