#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

namespace dsc {

struct CachedLayout {
    QJsonObject layout;
    QJsonObject data;
};

/// Local store of the last layouts pushed by the server, used to keep
/// showing content while offline.
class ILayoutCache {
public:
    virtual ~ILayoutCache() = default;

    virtual bool saveLayout(const QJsonObject& layout, const QJsonObject& data, bool setCurrent) = 0;
    virtual std::optional<CachedLayout> currentLayout() const = 0;
    virtual bool hasLayout() const = 0;
    virtual int layoutCount() const = 0;
    virtual QString currentLayoutId() const = 0;
    virtual bool clear() = 0;
};

} // namespace dsc
