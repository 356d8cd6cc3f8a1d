#pragma once

#include <QJsonObject>
#include <QString>

namespace dsc {

/// Host facts reported to the server at registration and with every
/// heartbeat.
class IDeviceInfoProvider {
public:
    virtual ~IDeviceInfoProvider() = default;

    /// Full snapshot sent with REGISTER.
    virtual QJsonObject deviceInfo() = 0;
    /// CpuTemperature, CpuUsage, MemoryUsed, Uptime.
    virtual QJsonObject heartbeatInfo() = 0;

    virtual QString macAddress() const = 0;
    virtual QString ipAddress() const = 0;
};

} // namespace dsc
