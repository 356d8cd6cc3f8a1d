#include "core/cache/FileLayoutCache.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QSaveFile>
#include <boost/log/trivial.hpp>

namespace dsc {

FileLayoutCache::FileLayoutCache(const QString& dir)
    : dir_(dir)
{
}

bool FileLayoutCache::saveLayout(const QJsonObject& layout, const QJsonObject& data, bool setCurrent)
{
    QMutexLocker lock(&mutex_);
    if (!QDir().mkpath(layoutsDir())) {
        BOOST_LOG_TRIVIAL(error) << "[LayoutCache] cannot create " << layoutsDir().toStdString();
        return false;
    }

    const QString id = layoutId(layout);
    QJsonObject entry;
    entry["layout"] = layout;
    entry["data"] = data;
    entry["cached_at"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    if (!writeJson(layoutPath(id), entry))
        return false;

    if (setCurrent) {
        QJsonObject current;
        current["id"] = id;
        if (!writeJson(currentPath(), current))
            return false;
    }
    BOOST_LOG_TRIVIAL(info) << "[LayoutCache] saved layout " << id.toStdString()
                            << (setCurrent ? " (current)" : "");
    return true;
}

std::optional<CachedLayout> FileLayoutCache::currentLayout() const
{
    QMutexLocker lock(&mutex_);
    const auto current = readJson(currentPath());
    if (!current)
        return std::nullopt;

    const auto entry = readJson(layoutPath(current->value("id").toString()));
    if (!entry)
        return std::nullopt;

    CachedLayout result;
    result.layout = entry->value("layout").toObject();
    result.data = entry->value("data").toObject();
    return result;
}

bool FileLayoutCache::hasLayout() const
{
    return currentLayout().has_value();
}

int FileLayoutCache::layoutCount() const
{
    QMutexLocker lock(&mutex_);
    return QDir(layoutsDir()).entryList({"*.json"}, QDir::Files).size();
}

QString FileLayoutCache::currentLayoutId() const
{
    QMutexLocker lock(&mutex_);
    const auto current = readJson(currentPath());
    return current ? current->value("id").toString() : QString();
}

bool FileLayoutCache::clear()
{
    QMutexLocker lock(&mutex_);
    bool ok = true;
    QDir layouts(layoutsDir());
    if (layouts.exists())
        ok = layouts.removeRecursively();
    if (QFile::exists(currentPath()))
        ok = QFile::remove(currentPath()) && ok;
    if (ok)
        BOOST_LOG_TRIVIAL(info) << "[LayoutCache] cleared";
    else
        BOOST_LOG_TRIVIAL(error) << "[LayoutCache] failed to clear " << dir_.toStdString();
    return ok;
}

QString FileLayoutCache::layoutsDir() const
{
    return dir_ + "/layouts";
}

QString FileLayoutCache::layoutPath(const QString& id) const
{
    QString safe = id;
    safe.replace(QRegularExpression("[^A-Za-z0-9_.-]"), "_");
    return layoutsDir() + "/" + safe + ".json";
}

QString FileLayoutCache::currentPath() const
{
    return dir_ + "/current.json";
}

QString FileLayoutCache::layoutId(const QJsonObject& layout)
{
    const QJsonValue id = layout.value("Id");
    if (id.isString() && !id.toString().isEmpty())
        return id.toString();
    if (id.isDouble())
        return QString::number(id.toInteger());
    return QStringLiteral("current");
}

bool FileLayoutCache::writeJson(const QString& path, const QJsonObject& obj)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(error) << "[LayoutCache] cannot write " << path.toStdString()
                                 << ": " << file.errorString().toStdString();
        return false;
    }
    file.write(QJsonDocument(obj).toJson(QJsonDocument::Compact));
    return file.commit();
}

std::optional<QJsonObject> FileLayoutCache::readJson(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return std::nullopt;

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "[LayoutCache] corrupt cache file " << path.toStdString();
        return std::nullopt;
    }
    return doc.object();
}

} // namespace dsc
