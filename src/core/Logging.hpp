#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace odb {

/// Maps "trace|debug|info|warning|error|fatal" to a severity; false for
/// anything else.
bool parseLogLevel(const QString& name, boost::log::trivial::severity_level& out);

/// Sets the Boost.Log severity filter and routes Qt messages (qDebug and
/// friends, used by the device library) into the same stream. Unknown level
/// names fall back to debug.
void initLogging(const QString& levelName);

} // namespace odb
