#ifndef YADWH_LOGGING_H_
#define YADWH_LOGGING_H_

#include <boost/log/trivial.hpp>

#define LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LOG_INFO BOOST_LOG_TRIVIAL(info)
#define LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

namespace yadwh {

// Installs the console sink; colors are applied per severity if `use_colors` is set.
void logger_init(bool use_colors = false);
void logger_set_threshold(boost::log::trivial::severity_level threshold);
// Accepts 0-5 (trace, debug, info, warning, error, fatal), values out of range are clamped.
void logger_set_threshold(int level);
int logger_get_severity();

}  // namespace yadwh

#endif  // YADWH_LOGGING_H_
