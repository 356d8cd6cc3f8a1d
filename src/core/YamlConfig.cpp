#include "core/YamlConfig.hpp"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QUuid>
#include <fstream>

namespace dsc {

namespace {

// Maps recurse; scalars and sequences from the file replace the default.
YAML::Node mergeOverDefaults(const YAML::Node& defaults, const YAML::Node& loaded)
{
    if (!loaded.IsDefined() || loaded.IsNull())
        return YAML::Clone(defaults);
    if (!defaults.IsMap() || !loaded.IsMap())
        return YAML::Clone(loaded);

    YAML::Node merged = YAML::Clone(defaults);
    for (const auto& entry : loaded) {
        const std::string key = entry.first.as<std::string>();
        merged[key] = merged[key] ? mergeOverDefaults(merged[key], entry.second)
                                  : YAML::Clone(entry.second);
    }
    return merged;
}

QVariant scalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());
    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool ok = false;
    const int i = s.toInt(&ok);
    if (ok) return QVariant(i);
    const double d = s.toDouble(&ok);
    if (ok) return QVariant(d);
    return QVariant(s);
}

bool isNumeric(const QVariant& v)
{
    switch (v.typeId()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Double:
    case QMetaType::Float:
        return true;
    default:
        return false;
    }
}

// Defaults carry the leaf's type; numbers are one family since a default
// like 5.0 is emitted as "5".
bool matchesSchemaType(const YAML::Node& schemaLeaf, const QVariant& value)
{
    const QVariant expected = scalarToVariant(schemaLeaf);
    switch (expected.typeId()) {
    case QMetaType::Bool:
        return value.typeId() == QMetaType::Bool;
    case QMetaType::Int:
    case QMetaType::Double:
        return isNumeric(value);
    default:
        return value.typeId() == QMetaType::QString;
    }
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["client"]["id"] = "";
    root_["client"]["registration_token"] = "";

    root_["server"]["host"] = "localhost";
    root_["server"]["port"] = 8080;
    root_["server"]["endpoint_path"] = "ws";
    root_["server"]["use_ssl"] = false;
    root_["server"]["verify_ssl"] = true;

    root_["discovery"]["auto_discover"] = false;
    root_["discovery"]["timeout"] = 5.0;
    root_["discovery"]["broadcast_port"] = 5555;
    root_["discovery"]["service_type"] = "_digitalsignage._tcp";

    root_["display"]["show_cached_layout_on_disconnect"] = true;
    root_["display"]["no_layout_grace_seconds"] = 10;

    root_["heartbeat"]["interval"] = 30;

    root_["reconnect"]["schedule"] = YAML::Node(YAML::NodeType::Sequence);
    for (int s : {10, 20, 30, 60, 120})
        root_["reconnect"]["schedule"].push_back(s);

    root_["cache"]["dir"] = "/var/cache/digitalsignage";

    root_["logging"]["level"] = "info";
    root_["logging"]["file"] = "";
    root_["logging"]["remote"]["enabled"] = true;
    root_["logging"]["remote"]["level"] = "info";
    root_["logging"]["remote"]["batch_size"] = 50;
    root_["logging"]["remote"]["batch_interval"] = 5.0;
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    try {
        const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeOverDefaults(root_, loaded);
    } catch (const YAML::Exception& e) {
        qWarning() << "[YamlConfig] failed to load" << filePath << ":" << e.what()
                   << "- using defaults";
        initDefaults();
        return false;
    }
    return true;
}

bool YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        qWarning() << "[YamlConfig] cannot write" << filePath;
        return false;
    }
    fout << root_;
    return fout.good();
}

// --- Client identity ---

QString YamlConfig::clientId() const
{
    return QString::fromStdString(root_["client"]["id"].as<std::string>(""));
}

void YamlConfig::setClientId(const QString& v)
{
    root_["client"]["id"] = v.toStdString();
}

bool YamlConfig::ensureClientId()
{
    if (!clientId().isEmpty())
        return false;
    setClientId(QUuid::createUuid().toString(QUuid::WithoutBraces));
    return true;
}

QString YamlConfig::registrationToken() const
{
    return QString::fromStdString(root_["client"]["registration_token"].as<std::string>(""));
}

void YamlConfig::setRegistrationToken(const QString& v)
{
    root_["client"]["registration_token"] = v.toStdString();
}

// --- Server ---

QString YamlConfig::serverHost() const
{
    return QString::fromStdString(root_["server"]["host"].as<std::string>("localhost"));
}

void YamlConfig::setServerHost(const QString& v)
{
    root_["server"]["host"] = v.toStdString();
}

int YamlConfig::serverPort() const
{
    return root_["server"]["port"].as<int>(8080);
}

void YamlConfig::setServerPort(int v)
{
    root_["server"]["port"] = v;
}

QString YamlConfig::endpointPath() const
{
    return QString::fromStdString(root_["server"]["endpoint_path"].as<std::string>("ws"));
}

void YamlConfig::setEndpointPath(const QString& v)
{
    QString path = v;
    while (path.startsWith('/'))
        path.remove(0, 1);
    root_["server"]["endpoint_path"] = path.toStdString();
}

bool YamlConfig::useSsl() const
{
    return root_["server"]["use_ssl"].as<bool>(false);
}

void YamlConfig::setUseSsl(bool v)
{
    root_["server"]["use_ssl"] = v;
}

bool YamlConfig::verifySsl() const
{
    return root_["server"]["verify_ssl"].as<bool>(true);
}

void YamlConfig::setVerifySsl(bool v)
{
    root_["server"]["verify_ssl"] = v;
}

QUrl YamlConfig::serverUrl() const
{
    QUrl url;
    url.setScheme(useSsl() ? "wss" : "ws");
    url.setHost(serverHost());
    url.setPort(serverPort());
    url.setPath("/" + endpointPath());
    return url;
}

// --- Discovery ---

bool YamlConfig::autoDiscover() const
{
    return root_["discovery"]["auto_discover"].as<bool>(false);
}

void YamlConfig::setAutoDiscover(bool v)
{
    root_["discovery"]["auto_discover"] = v;
}

double YamlConfig::discoveryTimeout() const
{
    return root_["discovery"]["timeout"].as<double>(5.0);
}

void YamlConfig::setDiscoveryTimeout(double seconds)
{
    root_["discovery"]["timeout"] = seconds;
}

int YamlConfig::broadcastPort() const
{
    return root_["discovery"]["broadcast_port"].as<int>(5555);
}

QString YamlConfig::serviceType() const
{
    return QString::fromStdString(
        root_["discovery"]["service_type"].as<std::string>("_digitalsignage._tcp"));
}

// --- Display ---

bool YamlConfig::showCachedLayoutOnDisconnect() const
{
    return root_["display"]["show_cached_layout_on_disconnect"].as<bool>(true);
}

void YamlConfig::setShowCachedLayoutOnDisconnect(bool v)
{
    root_["display"]["show_cached_layout_on_disconnect"] = v;
}

int YamlConfig::noLayoutGraceSeconds() const
{
    return root_["display"]["no_layout_grace_seconds"].as<int>(10);
}

// --- Heartbeat / reconnect ---

int YamlConfig::heartbeatInterval() const
{
    return root_["heartbeat"]["interval"].as<int>(30);
}

QList<int> YamlConfig::reconnectSchedule() const
{
    QList<int> result;
    const YAML::Node seq = root_["reconnect"]["schedule"];
    if (seq.IsSequence()) {
        for (const auto& item : seq)
            result << item.as<int>(0);
    }
    return result;
}

void YamlConfig::setReconnectSchedule(const QList<int>& seconds)
{
    YAML::Node seq(YAML::NodeType::Sequence);
    for (int s : seconds)
        seq.push_back(s);
    root_["reconnect"]["schedule"] = seq;
}

// --- Cache ---

QString YamlConfig::cacheDir() const
{
    return QString::fromStdString(
        root_["cache"]["dir"].as<std::string>("/var/cache/digitalsignage"));
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

QString YamlConfig::logFile() const
{
    return QString::fromStdString(root_["logging"]["file"].as<std::string>(""));
}

bool YamlConfig::remoteLoggingEnabled() const
{
    return root_["logging"]["remote"]["enabled"].as<bool>(true);
}

QString YamlConfig::remoteLogLevel() const
{
    return QString::fromStdString(root_["logging"]["remote"]["level"].as<std::string>("info"));
}

int YamlConfig::remoteLogBatchSize() const
{
    return root_["logging"]["remote"]["batch_size"].as<int>(50);
}

double YamlConfig::remoteLogBatchInterval() const
{
    return root_["logging"]["remote"]["batch_interval"].as<double>(5.0);
}

// --- Generic dot-path access ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }
    return scalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only scalar leaves that exist in the defaults schema are writable
    YAML::Node schema = buildDefaultsNode();
    for (const auto& part : parts) {
        if (!schema.IsMap()) return false;
        schema.reset(schema[part.toStdString()]);
        if (!schema.IsDefined()) return false;
    }
    if (!schema.IsScalar()) return false;
    if (!matchesSchemaType(schema, value)) {
        qWarning() << "[YamlConfig] type mismatch for" << dottedKey << "value" << value;
        return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        node.reset(node[parts[i].toStdString()]);

    const std::string leaf = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leaf] = value.toBool();
        break;
    case QMetaType::Int:
    case QMetaType::LongLong:
        node[leaf] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leaf] = value.toDouble();
        break;
    default:
        node[leaf] = value.toString().toStdString();
        break;
    }
    return true;
}

} // namespace dsc
