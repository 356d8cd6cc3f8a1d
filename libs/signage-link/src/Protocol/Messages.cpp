#include <slink/Protocol/Messages.hpp>
#include <QDateTime>

namespace slink {
namespace messages {

QString timestampNow()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

QJsonObject envelope(const char* type, const QString& clientId)
{
    QJsonObject msg;
    msg["Type"] = QString::fromLatin1(type);
    msg["ClientId"] = clientId;
    msg["Timestamp"] = timestampNow();
    return msg;
}

QJsonObject registerClient(const RegistrationInfo& info)
{
    QJsonObject msg = envelope(MessageType::Register, info.clientId);
    msg["MacAddress"] = info.macAddress;
    msg["IpAddress"] = info.ipAddress;
    msg["DeviceInfo"] = info.deviceInfo;
    if (!info.registrationToken.isEmpty())
        msg["RegistrationToken"] = info.registrationToken;
    return msg;
}

QJsonObject heartbeat(const QString& clientId, bool offlineRecovery,
                      const QJsonObject& deviceInfo, const QJsonObject& cacheInfo)
{
    QJsonObject msg = envelope(MessageType::Heartbeat, clientId);
    msg["Status"] = offlineRecovery ? QStringLiteral("OfflineRecovery") : QStringLiteral("Online");
    msg["DeviceInfo"] = deviceInfo;
    msg["CacheInfo"] = cacheInfo;
    return msg;
}

QJsonObject statusReport(const QString& clientId, const QJsonObject& deviceInfo,
                         const QString& currentLayoutId)
{
    QJsonObject msg = envelope(MessageType::StatusReport, clientId);
    msg["Status"] = QStringLiteral("Online");
    msg["DeviceInfo"] = deviceInfo;
    msg["CurrentLayoutId"] = currentLayoutId.isEmpty() ? QJsonValue() : QJsonValue(currentLayoutId);
    return msg;
}

QJsonObject screenshot(const QString& clientId, const QByteArray& png)
{
    QJsonObject msg = envelope(MessageType::Screenshot, clientId);
    msg["ImageData"] = QString::fromLatin1(png.toBase64());
    msg["Format"] = QStringLiteral("png");
    return msg;
}

QJsonObject updateConfigResponse(const QString& clientId, bool success,
                                 const QString& errorMessage)
{
    QJsonObject msg = envelope(MessageType::UpdateConfigResponse, clientId);
    msg["Success"] = success;
    if (!errorMessage.isEmpty())
        msg["ErrorMessage"] = errorMessage;
    return msg;
}

QJsonObject log(const QString& clientId, const QString& level,
                const QString& message, const QString& exception)
{
    QJsonObject msg = envelope(MessageType::Log, clientId);
    msg["Level"] = level;
    msg["Message"] = message;
    msg["Exception"] = exception.isEmpty() ? QJsonValue() : QJsonValue(exception);
    return msg;
}

QString typeOf(const QJsonObject& message)
{
    return message.value("Type").toString();
}

} // namespace messages
} // namespace slink
