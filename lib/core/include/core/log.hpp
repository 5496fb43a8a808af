#pragma once

#include <boost/log/trivial.hpp>

namespace TaoMap::Log {

using Severity = boost::log::trivial::severity_level;

// Console sink with timestamp and severity; messages below level are dropped.
void init(Severity level = boost::log::trivial::info);

void set_level(Severity level);

} // namespace TaoMap::Log
