#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace dsc {
namespace logging {

struct Settings {
    QString level = QStringLiteral("info");
    QString file;
};

/// Console sink, optional file sink and the Qt message bridge. Call once,
/// before any component logs.
void init(const Settings& settings);

/// Changes the global severity filter at runtime.
void setLevel(const QString& level);

/// debug|info|warning|error|critical (case-insensitive). Unknown names map
/// to info and set *ok to false.
boost::log::trivial::severity_level parseLevel(const QString& level, bool* ok = nullptr);

/// Debug, Info, Warning, Error or Critical.
QString levelName(boost::log::trivial::severity_level level);

} // namespace logging
} // namespace dsc
