#include "core/system/WatchdogNotifier.hpp"
#include <QDebug>
#include <QtGlobal>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace dsc {

WatchdogSettings WatchdogSettings::fromEnvironment()
{
    WatchdogSettings s;
    s.notifySocket = qEnvironmentVariable("NOTIFY_SOCKET");
    bool ok = false;
    const qint64 usec = qEnvironmentVariable("WATCHDOG_USEC").toLongLong(&ok);
    if (ok && usec > 0)
        s.watchdogUsec = usec;
    const qint64 pid = qEnvironmentVariable("WATCHDOG_PID").toLongLong(&ok);
    if (ok && pid > 0)
        s.watchdogPid = pid;
    return s;
}

WatchdogNotifier::WatchdogNotifier(const WatchdogSettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
{
    connect(&pingTimer_, &QTimer::timeout, this, &WatchdogNotifier::ping);

    if (!isEnabled())
        qInfo() << "[Watchdog] not running under systemd notify, notifications disabled";
    else if (isWatchdogActive())
        qInfo() << "[Watchdog] systemd watchdog" << settings_.watchdogUsec / 1000 << "ms via"
                << settings_.notifySocket;
    else
        qInfo() << "[Watchdog] notify socket" << settings_.notifySocket << "(no watchdog timeout)";
}

bool WatchdogNotifier::isEnabled() const
{
    return !settings_.notifySocket.isEmpty();
}

bool WatchdogNotifier::isWatchdogActive() const
{
    if (!isEnabled() || settings_.watchdogUsec <= 0)
        return false;
    // WATCHDOG_PID names the process the manager expects pings from
    return settings_.watchdogPid == 0 || settings_.watchdogPid == ::getpid();
}

int WatchdogNotifier::pingIntervalMs() const
{
    if (!isWatchdogActive())
        return 0;
    return static_cast<int>(qMax<qint64>(1, settings_.watchdogUsec / 2000));
}

void WatchdogNotifier::start()
{
    if (!isWatchdogActive() || pingTimer_.isActive())
        return;
    pingTimer_.start(pingIntervalMs());
    ping();
}

void WatchdogNotifier::stop()
{
    pingTimer_.stop();
}

bool WatchdogNotifier::notifyReady()
{
    if (!isEnabled())
        return false;
    readySent_ = true;
    qInfo() << "[Watchdog] service ready";
    return send("READY=1");
}

bool WatchdogNotifier::notifyStopping()
{
    stop();
    if (!isEnabled())
        return false;
    return send("STOPPING=1");
}

bool WatchdogNotifier::notifyStatus(const QString& status)
{
    if (!isEnabled())
        return false;
    return send("STATUS=" + status.toUtf8());
}

bool WatchdogNotifier::ping()
{
    if (!isWatchdogActive())
        return false;
    return send("WATCHDOG=1");
}

void WatchdogNotifier::onOnlineChanged(bool online)
{
    if (online) {
        notifyStatus(QStringLiteral("Connected to server"));
        if (!readySent_)
            notifyReady();
    } else {
        notifyStatus(QStringLiteral("Disconnected, reconnecting"));
    }
}

void WatchdogNotifier::onOfflineModeEntered()
{
    notifyStatus(QStringLiteral("Running in offline mode"));
    if (!readySent_)
        notifyReady();
}

bool WatchdogNotifier::send(const QByteArray& message)
{
    const QByteArray path = settings_.notifySocket.toLocal8Bit();
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= static_cast<int>(sizeof(addr.sun_path))) {
        qWarning() << "[Watchdog] notify socket path too long:" << settings_.notifySocket;
        return false;
    }
    std::memcpy(addr.sun_path, path.constData(), path.size());
    if (path.startsWith('@'))
        addr.sun_path[0] = '\0';
    const socklen_t len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size()
                                                 + (path.startsWith('@') ? 0 : 1));

    const int fd = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        qWarning() << "[Watchdog] socket failed:" << std::strerror(errno);
        return false;
    }
    const ssize_t sent = ::sendto(fd, message.constData(), static_cast<size_t>(message.size()),
                                  MSG_NOSIGNAL, reinterpret_cast<const sockaddr*>(&addr), len);
    const int err = errno;
    ::close(fd);

    if (sent < 0) {
        qWarning() << "[Watchdog] could not send" << message << "to" << settings_.notifySocket
                   << ":" << std::strerror(err);
        return false;
    }
    qDebug() << "[Watchdog] sent" << message;
    return true;
}

} // namespace dsc
