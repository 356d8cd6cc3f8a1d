#include "core/discovery/AvahiDiscovery.hpp"
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusInterface>
#include <QDBusObjectPath>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDBusReply>
#include <QDebug>

namespace dsc {

namespace {
const QString kAvahiService = QStringLiteral("org.freedesktop.Avahi");
const QString kServerIface = QStringLiteral("org.freedesktop.Avahi.Server");
const QString kServer2Iface = QStringLiteral("org.freedesktop.Avahi.Server2");
const QString kBrowserIface = QStringLiteral("org.freedesktop.Avahi.ServiceBrowser");

constexpr int kIfUnspec = -1;
constexpr int kProtoUnspec = -1;
constexpr int kProtoInet = 0;
} // namespace

AvahiDiscovery::AvahiDiscovery(const QString& serviceType, QObject* parent)
    : IDiscoveryMethod(parent)
    , serviceType_(serviceType)
{
    timeout_.setSingleShot(true);
    connect(&timeout_, &QTimer::timeout, this, &AvahiDiscovery::finish);
}

AvahiDiscovery::~AvahiDiscovery()
{
    if (running_) {
        subscribe(false);
        if (!browserPath_.isEmpty()) {
            QDBusInterface browser(kAvahiService, browserPath_, kBrowserIface,
                                   QDBusConnection::systemBus());
            browser.call(QDBus::NoBlock, "Free");
        }
    }
}

void AvahiDiscovery::start(int timeoutMs)
{
    if (running_) return;
    running_ = true;
    ++generation_;
    found_.clear();
    browserPath_.clear();

    if (!QDBusConnection::systemBus().isConnected()) {
        fail(QStringLiteral("system bus unavailable"));
        return;
    }

    // Subscribe before the browser exists so early ItemNew signals are not lost
    subscribe(true);
    if (!createBrowser())
        return;

    qInfo() << "[AvahiDiscovery] browsing" << serviceType_ << "for" << timeoutMs << "ms";
    timeout_.start(timeoutMs);
}

void AvahiDiscovery::cancel()
{
    if (!running_) return;
    timeout_.stop();
    finish();
}

bool AvahiDiscovery::createBrowser()
{
    auto bus = QDBusConnection::systemBus();

    // Avahi >= 0.7: prepare, then Start once our match rules are in place
    QDBusInterface server2(kAvahiService, "/", kServer2Iface, bus);
    QDBusReply<QDBusObjectPath> prepared = server2.call(
        "ServiceBrowserPrepare", kIfUnspec, kProtoUnspec, serviceType_, QString(), 0u);
    if (prepared.isValid()) {
        browserPath_ = prepared.value().path();
        QDBusInterface browser(kAvahiService, browserPath_, kBrowserIface, bus);
        QDBusReply<void> started = browser.call("Start");
        if (!started.isValid()) {
            fail(QStringLiteral("ServiceBrowser.Start failed: %1").arg(started.error().message()));
            return false;
        }
        return true;
    }

    QDBusInterface server(kAvahiService, "/", kServerIface, bus);
    QDBusReply<QDBusObjectPath> created = server.call(
        "ServiceBrowserNew", kIfUnspec, kProtoUnspec, serviceType_, QString(), 0u);
    if (!created.isValid()) {
        fail(QStringLiteral("ServiceBrowserNew failed: %1").arg(created.error().message()));
        return false;
    }
    browserPath_ = created.value().path();
    return true;
}

void AvahiDiscovery::subscribe(bool on)
{
    auto bus = QDBusConnection::systemBus();
    if (on) {
        bus.connect(kAvahiService, QString(), kBrowserIface, "ItemNew",
                    this, SLOT(onItemNew(int,int,QString,QString,QString,uint)));
        bus.connect(kAvahiService, QString(), kBrowserIface, "Failure",
                    this, SLOT(onBrowserFailure(QString)));
    } else {
        bus.disconnect(kAvahiService, QString(), kBrowserIface, "ItemNew",
                       this, SLOT(onItemNew(int,int,QString,QString,QString,uint)));
        bus.disconnect(kAvahiService, QString(), kBrowserIface, "Failure",
                       this, SLOT(onBrowserFailure(QString)));
    }
}

void AvahiDiscovery::onItemNew(int interface, int protocol, const QString& name,
                               const QString& type, const QString& domain, uint flags)
{
    Q_UNUSED(protocol)
    Q_UNUSED(flags)
    if (!running_ || type != serviceType_)
        return;

    qDebug() << "[AvahiDiscovery] service" << name << "on interface" << interface;
    QDBusInterface server(kAvahiService, "/", kServerIface, QDBusConnection::systemBus());
    QDBusPendingCall pending = server.asyncCall(
        "ResolveService", interface, kProtoUnspec, name, type, domain, kProtoInet, 0u);

    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    const int generation = generation_;
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, generation]() {
        watcher->deleteLater();
        if (generation != generation_ || !running_)
            return;  // scan already over
        onResolved(watcher);
    });
}

void AvahiDiscovery::onResolved(QDBusPendingCallWatcher* watcher)
{
    const QDBusMessage reply = watcher->reply();
    if (reply.type() != QDBusMessage::ReplyMessage) {
        qWarning() << "[AvahiDiscovery] resolve failed:" << reply.errorMessage();
        return;
    }

    // (i iface, i proto, s name, s type, s domain, s host, i aproto, s address, q port, aay txt, u flags)
    const QList<QVariant> args = reply.arguments();
    if (args.size() < 10) {
        qWarning() << "[AvahiDiscovery] unexpected ResolveService reply with" << args.size() << "fields";
        return;
    }

    QList<QByteArray> txt;
    const QDBusArgument txtArg = args.at(9).value<QDBusArgument>();
    txtArg >> txt;

    const auto resolved = fromResolved(args.at(2).toString(), args.at(7).toString(),
                                       args.at(8).toInt(), txt);
    if (!resolved) {
        qWarning() << "[AvahiDiscovery]" << args.at(2).toString() << "resolved without an address, skipped";
        return;
    }
    const ServerCandidate& candidate = *resolved;

    for (auto& existing : found_) {
        if (existing.name == candidate.name) {
            for (const auto& addr : candidate.addresses) {
                if (!existing.addresses.contains(addr))
                    existing.addresses << addr;
            }
            return;
        }
    }
    qInfo() << "[AvahiDiscovery] found" << candidate.name << "at" << candidate.url().toString();
    found_ << candidate;
}

void AvahiDiscovery::onBrowserFailure(const QString& error)
{
    if (!running_) return;
    timeout_.stop();
    fail(QStringLiteral("browser failure: %1").arg(error));
}

QHash<QString, QString> AvahiDiscovery::parseTxt(const QList<QByteArray>& txt)
{
    QHash<QString, QString> props;
    for (const auto& entry : txt) {
        const int eq = entry.indexOf('=');
        if (eq <= 0) continue;
        props.insert(QString::fromUtf8(entry.left(eq)).toLower(),
                     QString::fromUtf8(entry.mid(eq + 1)));
    }
    return props;
}

std::optional<ServerCandidate> AvahiDiscovery::fromResolved(const QString& serviceName,
                                                           const QString& address, int port,
                                                           const QList<QByteArray>& txt)
{
    if (address.trimmed().isEmpty())
        return std::nullopt;
    const auto props = parseTxt(txt);

    ServerCandidate c;
    c.source = QStringLiteral("mdns");
    c.name = props.value("server_name", serviceName);
    if (c.name.isEmpty())
        c.name = QStringLiteral("Unknown");
    c.addresses << address.trimmed();
    c.port = port > 0 ? port : 8080;
    c.protocol = props.value("protocol", QStringLiteral("ws"));
    QString path = props.value("endpoint", QStringLiteral("ws"));
    while (path.startsWith('/'))
        path.remove(0, 1);
    c.endpointPath = path;
    const QString ssl = props.value("ssl_enabled").toLower();
    c.sslEnabled = (ssl == "true" || ssl == "1" || ssl == "yes");
    c.discoveredAt = QDateTime::currentDateTimeUtc();
    return c;
}

void AvahiDiscovery::fail(const QString& reason)
{
    qWarning() << "[AvahiDiscovery] scan aborted:" << reason;
    QMetaObject::invokeMethod(this, [this]() { finish(); }, Qt::QueuedConnection);
}

void AvahiDiscovery::finish()
{
    if (!running_) return;
    running_ = false;
    subscribe(false);

    if (!browserPath_.isEmpty()) {
        QDBusInterface browser(kAvahiService, browserPath_, kBrowserIface,
                               QDBusConnection::systemBus());
        browser.call(QDBus::NoBlock, "Free");
        browserPath_.clear();
    }

    qInfo() << "[AvahiDiscovery] complete, found" << found_.size() << "server(s)";
    emit finished(found_);
}

} // namespace dsc
