#pragma once

// Internal logging macros.  Records go to the Boost.Log core; sinks and
// filters are the application's business.

#include <boost/log/trivial.hpp>

#define BINDERY_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define BINDERY_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define BINDERY_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define BINDERY_LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define BINDERY_LOG_ERROR BOOST_LOG_TRIVIAL(error)
