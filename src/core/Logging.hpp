#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace tas {

/// Parse "trace".."fatal" (case-insensitive). Unknown names give info.
boost::log::trivial::severity_level parseSeverity(const QString& name);

/// Route Boost.Log to stdout with a severity-coloured formatter and set the
/// threshold. Colours are only emitted when stdout is a terminal.
void initLogging(boost::log::trivial::severity_level threshold);

} // namespace tas
