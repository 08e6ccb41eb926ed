#ifndef LOGGING_H
#define LOGGING_H

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>

#define _TRACE BOOST_LOG_TRIVIAL(trace)
#define _DEBUG BOOST_LOG_TRIVIAL(debug)
#define _INFO  BOOST_LOG_TRIVIAL(info)
#define _WARN  BOOST_LOG_TRIVIAL(warning)
#define _ERROR BOOST_LOG_TRIVIAL(error)
#define _FATAL BOOST_LOG_TRIVIAL(fatal)

void init_boost_log(bool verbose);

#endif  //  end for LOGGING_H
