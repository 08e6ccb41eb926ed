#include "logging.h"
#include <iostream>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

void init_boost_log(bool verbose) {
  namespace logging = boost::log;
  namespace expr = boost::log::expressions;
  namespace keywords = boost::log::keywords;

  logging::core::get()->remove_all_sinks();
  logging::add_console_log(std::clog,
    keywords::format = (
      expr::stream << "["
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
      << "] " << expr::smessage
    ));
  logging::add_common_attributes();

  if (verbose) {
    logging::core::get()->set_filter(logging::trivial::severity >= logging::trivial::debug);
  } else {
    logging::core::get()->set_filter(logging::trivial::severity >= logging::trivial::info);
  }
}
