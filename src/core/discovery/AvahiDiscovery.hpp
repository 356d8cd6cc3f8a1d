#pragma once

#include <QHash>
#include <QTimer>
#include <optional>
#include "core/discovery/IDiscoveryMethod.hpp"

class QDBusPendingCallWatcher;

namespace dsc {

/// Multicast service-advertisement discovery through the Avahi daemon on
/// the system bus. Browses for serviceType, resolves every hit and reads
/// server_name / protocol / endpoint / ssl_enabled from the TXT record.
class AvahiDiscovery : public IDiscoveryMethod {
    Q_OBJECT
public:
    explicit AvahiDiscovery(const QString& serviceType = QStringLiteral("_digitalsignage._tcp"),
                            QObject* parent = nullptr);
    ~AvahiDiscovery() override;

    QString name() const override { return QStringLiteral("mdns"); }
    void start(int timeoutMs) override;
    void cancel() override;
    bool isRunning() const override { return running_; }

    /// Builds a candidate from a resolved service; nothing when the
    /// service resolved without an address. Exposed for tests.
    static std::optional<ServerCandidate> fromResolved(const QString& serviceName, const QString& address,
                                        int port, const QList<QByteArray>& txt);
    static QHash<QString, QString> parseTxt(const QList<QByteArray>& txt);

private slots:
    void onItemNew(int interface, int protocol, const QString& name,
                   const QString& type, const QString& domain, uint flags);
    void onBrowserFailure(const QString& error);

private:
    bool createBrowser();
    void subscribe(bool on);
    void onResolved(QDBusPendingCallWatcher* watcher);
    void finish();
    void fail(const QString& reason);

    QString serviceType_;
    QString browserPath_;
    QTimer timeout_;
    QList<ServerCandidate> found_;
    bool running_ = false;
    int generation_ = 0;
};

} // namespace dsc
