#include "Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace srt {

boost::log::trivial::severity_level severityFromName(const QString& name)
{
    using namespace boost::log::trivial;
    const QString n = name.trimmed().toLower();
    if (n == "trace")   return trace;
    if (n == "debug")   return debug;
    if (n == "warning" || n == "warn") return warning;
    if (n == "error")   return error;
    if (n == "fatal")   return fatal;
    return info;
}

void initLogging(const QString& level)
{
    const auto min = severityFromName(level);
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min);
    BOOST_LOG_TRIVIAL(debug) << "[Logging] Severity filter set to " << level.toStdString();
}

} // namespace srt
