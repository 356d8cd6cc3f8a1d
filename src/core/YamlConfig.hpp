#pragma once

#include <QList>
#include <QString>
#include <QUrl>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace dsc {

class YamlConfig {
public:
    YamlConfig();

    /// Merges the file over the built-in defaults. On a parse error the
    /// defaults stay in place and false is returned.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    // Client identity
    QString clientId() const;
    void setClientId(const QString& v);
    /// Generates and stores a UUID when no id is configured yet.
    bool ensureClientId();
    QString registrationToken() const;
    void setRegistrationToken(const QString& v);

    // Server
    QString serverHost() const;
    void setServerHost(const QString& v);
    int serverPort() const;
    void setServerPort(int v);
    QString endpointPath() const;
    void setEndpointPath(const QString& v);
    bool useSsl() const;
    void setUseSsl(bool v);
    bool verifySsl() const;
    void setVerifySsl(bool v);
    /// ws[s]://host:port/path built from the server section.
    QUrl serverUrl() const;

    // Discovery
    bool autoDiscover() const;
    void setAutoDiscover(bool v);
    double discoveryTimeout() const;
    void setDiscoveryTimeout(double seconds);
    int broadcastPort() const;
    QString serviceType() const;

    // Display
    bool showCachedLayoutOnDisconnect() const;
    void setShowCachedLayoutOnDisconnect(bool v);
    int noLayoutGraceSeconds() const;

    // Heartbeat / reconnect
    int heartbeatInterval() const;
    QList<int> reconnectSchedule() const;
    void setReconnectSchedule(const QList<int>& seconds);

    // Cache
    QString cacheDir() const;

    // Logging
    QString logLevel() const;
    QString logFile() const;
    bool remoteLoggingEnabled() const;
    QString remoteLogLevel() const;
    int remoteLogBatchSize() const;
    double remoteLogBatchInterval() const;

    // Generic dot-path access (e.g. "server.host")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace dsc
