#include "core/logging/Logging.hpp"
#include <QtGlobal>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <iostream>

namespace dsc {
namespace logging {

namespace bl = boost::log;
using bl::trivial::severity_level;

namespace {

constexpr char kFormat[] = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";

void qtMessageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    const std::string text = msg.toStdString();
    switch (type) {
    case QtDebugMsg:    BOOST_LOG_TRIVIAL(debug) << text; break;
    case QtInfoMsg:     BOOST_LOG_TRIVIAL(info) << text; break;
    case QtWarningMsg:  BOOST_LOG_TRIVIAL(warning) << text; break;
    case QtCriticalMsg: BOOST_LOG_TRIVIAL(error) << text; break;
    case QtFatalMsg:    BOOST_LOG_TRIVIAL(fatal) << text; break;
    }
}

} // namespace

severity_level parseLevel(const QString& level, bool* ok)
{
    const QString name = level.trimmed().toLower();
    if (ok) *ok = true;
    if (name == "trace") return severity_level::trace;
    if (name == "debug") return severity_level::debug;
    if (name == "info") return severity_level::info;
    if (name == "warning" || name == "warn") return severity_level::warning;
    if (name == "error") return severity_level::error;
    if (name == "critical" || name == "fatal") return severity_level::fatal;
    if (ok) *ok = false;
    return severity_level::info;
}

QString levelName(severity_level level)
{
    switch (level) {
    case severity_level::trace:
    case severity_level::debug:   return QStringLiteral("Debug");
    case severity_level::info:    return QStringLiteral("Info");
    case severity_level::warning: return QStringLiteral("Warning");
    case severity_level::error:   return QStringLiteral("Error");
    case severity_level::fatal:   return QStringLiteral("Critical");
    }
    return QStringLiteral("Info");
}

void setLevel(const QString& level)
{
    bool ok = false;
    const severity_level min = parseLevel(level, &ok);
    if (!ok)
        BOOST_LOG_TRIVIAL(warning) << "[Logging] unknown level '" << level.toStdString() << "', using info";
    bl::core::get()->set_filter(bl::trivial::severity >= min);
}

void init(const Settings& settings)
{
    bl::add_common_attributes();
    bl::register_simple_formatter_factory<severity_level, char>("Severity");

    bl::add_console_log(std::clog, bl::keywords::format = kFormat);
    if (!settings.file.isEmpty()) {
        bl::add_file_log(bl::keywords::file_name = settings.file.toStdString(),
                         bl::keywords::open_mode = std::ios_base::app,
                         bl::keywords::auto_flush = true,
                         bl::keywords::format = kFormat);
    }
    setLevel(settings.level);

    qInstallMessageHandler(qtMessageHandler);
    BOOST_LOG_TRIVIAL(info) << "[Logging] level " << settings.level.toStdString()
                            << (settings.file.isEmpty() ? "" : ", file " + settings.file.toStdString());
}

} // namespace logging
} // namespace dsc
