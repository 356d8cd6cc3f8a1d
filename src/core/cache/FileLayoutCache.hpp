#pragma once

#include <QMutex>
#include "core/cache/ILayoutCache.hpp"

namespace dsc {

/// ILayoutCache backed by JSON files: one file per layout under
/// <dir>/layouts/ plus <dir>/current.json naming the active one.
class FileLayoutCache : public ILayoutCache {
public:
    explicit FileLayoutCache(const QString& dir);

    bool saveLayout(const QJsonObject& layout, const QJsonObject& data, bool setCurrent) override;
    std::optional<CachedLayout> currentLayout() const override;
    bool hasLayout() const override;
    int layoutCount() const override;
    QString currentLayoutId() const override;
    bool clear() override;

private:
    QString layoutPath(const QString& id) const;
    QString layoutsDir() const;
    QString currentPath() const;
    static QString layoutId(const QJsonObject& layout);
    static bool writeJson(const QString& path, const QJsonObject& obj);
    static std::optional<QJsonObject> readJson(const QString& path);

    QString dir_;
    mutable QMutex mutex_;
};

} // namespace dsc
