#include "core/device/SystemDeviceInfo.hpp"
#include <QFile>
#include <QNetworkInterface>
#include <QStorageInfo>
#include <QSysInfo>

namespace dsc {

namespace {

QByteArray readSmallFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return {};
    return file.readAll();
}

// First interface that is up, not loopback, and has an IPv4 address
QNetworkInterface primaryInterface()
{
    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const auto& iface : interfaces) {
        const auto flags = iface.flags();
        if (!(flags & QNetworkInterface::IsUp) || !(flags & QNetworkInterface::IsRunning)
            || (flags & QNetworkInterface::IsLoopBack))
            continue;
        for (const auto& entry : iface.addressEntries()) {
            if (entry.ip().protocol() == QAbstractSocket::IPv4Protocol)
                return iface;
        }
    }
    return {};
}

} // namespace

QJsonObject SystemDeviceInfo::deviceInfo()
{
    const MemoryInfo mem = memoryInfo();
    const QStorageInfo root = QStorageInfo::root();

    QJsonObject info;
    info["Hostname"] = QSysInfo::machineHostName();
    info["Model"] = model();
    info["OsVersion"] = QSysInfo::prettyProductName();
    info["KernelVersion"] = QSysInfo::kernelVersion();
    info["IpAddress"] = ipAddress();
    info["MacAddress"] = macAddress();
    info["CpuTemperature"] = cpuTemperature();
    info["CpuUsage"] = cpuUsage();
    info["MemoryTotal"] = mem.total;
    info["MemoryUsed"] = mem.used;
    info["DiskTotal"] = root.bytesTotal();
    info["DiskUsed"] = root.bytesTotal() - root.bytesAvailable();
    info["Uptime"] = uptimeSeconds();
    return info;
}

QJsonObject SystemDeviceInfo::heartbeatInfo()
{
    QJsonObject info;
    info["CpuTemperature"] = cpuTemperature();
    info["CpuUsage"] = cpuUsage();
    info["MemoryUsed"] = memoryInfo().used;
    info["Uptime"] = uptimeSeconds();
    return info;
}

QString SystemDeviceInfo::macAddress() const
{
    const QString mac = primaryInterface().hardwareAddress().toLower();
    return mac.isEmpty() ? QStringLiteral("00:00:00:00:00:00") : mac;
}

QString SystemDeviceInfo::ipAddress() const
{
    const auto entries = primaryInterface().addressEntries();
    for (const auto& entry : entries) {
        if (entry.ip().protocol() == QAbstractSocket::IPv4Protocol)
            return entry.ip().toString();
    }
    return QStringLiteral("127.0.0.1");
}

double SystemDeviceInfo::cpuTemperature()
{
    bool ok = false;
    const double milli = readSmallFile("/sys/class/thermal/thermal_zone0/temp").trimmed().toDouble(&ok);
    return ok ? milli / 1000.0 : 0.0;
}

qint64 SystemDeviceInfo::uptimeSeconds()
{
    const QByteArray content = readSmallFile("/proc/uptime");
    bool ok = false;
    const double seconds = content.split(' ').value(0).toDouble(&ok);
    return ok ? static_cast<qint64>(seconds) : 0;
}

QString SystemDeviceInfo::model()
{
    QByteArray raw = readSmallFile("/proc/device-tree/model");
    raw.replace('\0', "");
    const QString name = QString::fromUtf8(raw).trimmed();
    return name.isEmpty() ? QSysInfo::currentCpuArchitecture() : name;
}

double SystemDeviceInfo::cpuUsage()
{
    // cpu  user nice system idle iowait irq softirq steal ...
    const QByteArray line = readSmallFile("/proc/stat").split('\n').value(0);
    const QList<QByteArray> fields = line.simplified().split(' ');
    if (fields.size() < 5 || fields[0] != "cpu")
        return 0.0;

    quint64 total = 0;
    for (int i = 1; i < fields.size(); ++i)
        total += fields[i].toULongLong();
    quint64 idle = fields[4].toULongLong();
    if (fields.size() > 5)
        idle += fields[5].toULongLong();

    const quint64 dTotal = total - lastCpuTotal_;
    const quint64 dIdle = idle - lastCpuIdle_;
    lastCpuTotal_ = total;
    lastCpuIdle_ = idle;
    if (dTotal == 0)
        return 0.0;
    return 100.0 * static_cast<double>(dTotal - dIdle) / static_cast<double>(dTotal);
}

SystemDeviceInfo::MemoryInfo SystemDeviceInfo::memoryInfo()
{
    MemoryInfo mem;
    qint64 available = -1;
    const QList<QByteArray> lines = readSmallFile("/proc/meminfo").split('\n');
    for (const QByteArray& line : lines) {
        const QList<QByteArray> parts = line.simplified().split(' ');
        if (parts.size() < 2)
            continue;
        if (parts[0] == "MemTotal:")
            mem.total = parts[1].toLongLong() * 1024;
        else if (parts[0] == "MemAvailable:")
            available = parts[1].toLongLong() * 1024;
    }
    if (available >= 0)
        mem.used = mem.total - available;
    return mem;
}

} // namespace dsc
