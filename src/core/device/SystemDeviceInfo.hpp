#pragma once

#include "core/device/IDeviceInfoProvider.hpp"

namespace dsc {

/// Reads /proc and /sys on Linux. Values that cannot be read are reported
/// as 0 rather than failing the whole snapshot.
class SystemDeviceInfo : public IDeviceInfoProvider {
public:
    QJsonObject deviceInfo() override;
    QJsonObject heartbeatInfo() override;

    QString macAddress() const override;
    QString ipAddress() const override;

    static double cpuTemperature();
    static qint64 uptimeSeconds();
    static QString model();

    /// Busy percentage since the previous call; first call measures since boot.
    double cpuUsage();

private:
    struct MemoryInfo {
        qint64 total = 0;
        qint64 used = 0;
    };
    static MemoryInfo memoryInfo();

    quint64 lastCpuTotal_ = 0;
    quint64 lastCpuIdle_ = 0;
};

} // namespace dsc
