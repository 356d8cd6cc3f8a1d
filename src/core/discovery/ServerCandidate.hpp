#pragma once

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QUrl>

namespace dsc {

/// A server found on the local network. Identity key is name.
struct ServerCandidate {
    QString name = QStringLiteral("Unknown");
    QStringList addresses;
    int port = 8080;
    QString protocol = QStringLiteral("ws");
    QString endpointPath = QStringLiteral("ws");
    bool sslEnabled = false;
    QDateTime discoveredAt;
    QString source;

    QString primaryAddress() const { return addresses.value(0); }

    QUrl url(int addressIndex = 0) const
    {
        QUrl u;
        u.setScheme(sslEnabled ? QStringLiteral("wss") : protocol);
        u.setHost(addresses.value(addressIndex));
        u.setPort(port);
        u.setPath("/" + endpointPath);
        return u;
    }

    QList<QUrl> urls() const
    {
        QList<QUrl> result;
        for (int i = 0; i < addresses.size(); ++i)
            result << url(i);
        return result;
    }
};

/// Appends candidates whose name is not already present, keeping order.
inline void mergeUniqueByName(QList<ServerCandidate>& into, const QList<ServerCandidate>& from)
{
    for (const auto& c : from) {
        bool seen = false;
        for (const auto& existing : into) {
            if (existing.name == c.name) { seen = true; break; }
        }
        if (!seen)
            into.append(c);
    }
}

} // namespace dsc

Q_DECLARE_METATYPE(dsc::ServerCandidate)
