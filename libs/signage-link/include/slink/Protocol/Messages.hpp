#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace slink {

namespace MessageType {
inline constexpr char Register[] = "REGISTER";
inline constexpr char RegistrationResponse[] = "REGISTRATION_RESPONSE";
inline constexpr char DisplayUpdate[] = "DISPLAY_UPDATE";
inline constexpr char Command[] = "COMMAND";
inline constexpr char Heartbeat[] = "HEARTBEAT";
inline constexpr char UpdateConfig[] = "UPDATE_CONFIG";
inline constexpr char UpdateConfigResponse[] = "UPDATE_CONFIG_RESPONSE";
inline constexpr char Log[] = "LOG";
inline constexpr char StatusReport[] = "STATUS_REPORT";
inline constexpr char Screenshot[] = "SCREENSHOT";
} // namespace MessageType

/// Identity fields sent with REGISTER.
struct RegistrationInfo {
    QString clientId;
    QString macAddress;
    QString ipAddress;
    QJsonObject deviceInfo;
    QString registrationToken;
};

namespace messages {

/// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T10:00:00.123Z
QString timestampNow();

/// {Type, ClientId, Timestamp}; every outbound message starts from this.
QJsonObject envelope(const char* type, const QString& clientId);

QJsonObject registerClient(const RegistrationInfo& info);
QJsonObject heartbeat(const QString& clientId, bool offlineRecovery,
                      const QJsonObject& deviceInfo, const QJsonObject& cacheInfo);
QJsonObject statusReport(const QString& clientId, const QJsonObject& deviceInfo,
                         const QString& currentLayoutId);
QJsonObject screenshot(const QString& clientId, const QByteArray& png);
QJsonObject updateConfigResponse(const QString& clientId, bool success,
                                 const QString& errorMessage = {});
QJsonObject log(const QString& clientId, const QString& level,
                const QString& message, const QString& exception = {});

/// Empty string when the object carries no string Type.
QString typeOf(const QJsonObject& message);

} // namespace messages

} // namespace slink
