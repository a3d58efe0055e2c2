#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace srt {

/// Map a config level name ("trace", "debug", "info", "warning", "error",
/// "fatal") to a Boost.Log severity. Unknown names map to info.
boost::log::trivial::severity_level severityFromName(const QString& name);

/// Install the global severity filter for BOOST_LOG_TRIVIAL.
void initLogging(const QString& level);

} // namespace srt
