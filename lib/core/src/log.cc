#include "core/log.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace TaoMap::Log {

namespace logging = boost::log;
namespace expr = boost::log::expressions;

void init(Severity level)
{
    logging::add_common_attributes();
    logging::add_console_log(
        std::clog,
        logging::keywords::format = (expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "] "
            << expr::smessage));
    set_level(level);
}

void set_level(Severity level)
{
    logging::core::get()->set_filter(logging::trivial::severity >= level);
}

} // namespace TaoMap::Log
