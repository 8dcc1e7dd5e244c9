#include "core/Logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <QtGlobal>

namespace odb {

namespace {

void forwardQtMessage(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    const std::string text = msg.toStdString();
    switch (type) {
    case QtDebugMsg:
        BOOST_LOG_TRIVIAL(debug) << text;
        break;
    case QtInfoMsg:
        BOOST_LOG_TRIVIAL(info) << text;
        break;
    case QtWarningMsg:
        BOOST_LOG_TRIVIAL(warning) << text;
        break;
    case QtCriticalMsg:
        BOOST_LOG_TRIVIAL(error) << text;
        break;
    case QtFatalMsg:
        BOOST_LOG_TRIVIAL(fatal) << text;
        break;
    }
}

} // namespace

bool parseLogLevel(const QString& name, boost::log::trivial::severity_level& out)
{
    using boost::log::trivial::severity_level;

    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("trace")) out = severity_level::trace;
    else if (n == QLatin1String("debug")) out = severity_level::debug;
    else if (n == QLatin1String("info")) out = severity_level::info;
    else if (n == QLatin1String("warning") || n == QLatin1String("warn")) out = severity_level::warning;
    else if (n == QLatin1String("error")) out = severity_level::error;
    else if (n == QLatin1String("fatal")) out = severity_level::fatal;
    else return false;
    return true;
}

void initLogging(const QString& levelName)
{
    auto level = boost::log::trivial::debug;
    const bool known = parseLogLevel(levelName, level);

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    qInstallMessageHandler(forwardQtMessage);

    if (!known)
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown level '" << levelName.toStdString()
                                   << "', using debug";
}

} // namespace odb
