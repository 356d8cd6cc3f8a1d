#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <QDebug>

namespace dsc {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    return config_->valueByPath(key);
}

bool ConfigService::setValue(const QString& key, const QVariant& val)
{
    const QVariant previous = config_->valueByPath(key);
    if (!config_->setValueByPath(key, val)) {
        qWarning() << "[ConfigService] rejected" << key << "=" << val;
        return false;
    }
    const QVariant current = config_->valueByPath(key);
    if (current != previous)
        emit configChanged(key, current);
    return true;
}

bool ConfigService::save()
{
    if (configPath_.isEmpty())
        return false;
    if (!config_->save(configPath_)) {
        qWarning() << "[ConfigService] failed to save" << configPath_;
        return false;
    }
    return true;
}

} // namespace dsc
