#pragma once

#include <QString>
#include <QVariant>

namespace dsc {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g., "server.host").
    /// Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Only keys present in the defaults schema are
    /// accepted; returns false otherwise.
    /// Must be called from the main thread (single-writer rule).
    virtual bool setValue(const QString& key, const QVariant& value) = 0;

    /// Flush config to disk.
    /// Must be called from the main thread.
    virtual bool save() = 0;
};

} // namespace dsc
