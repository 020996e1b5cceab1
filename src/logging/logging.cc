#include "logging/logging.h"

#include <algorithm>
#include <atomic>
#include <iostream>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace logging = boost::log;

namespace yadwh {

static std::atomic<int> current_severity{static_cast<int>(logging::trivial::info)};

static const char* colorFor(logging::trivial::severity_level level) {
  switch (level) {
    case logging::trivial::trace:
    case logging::trivial::debug:
      return "\x1b[2m";
    case logging::trivial::warning:
      return "\x1b[33m";
    case logging::trivial::error:
    case logging::trivial::fatal:
      return "\x1b[31m";
    default:
      return "";
  }
}

void logger_init(bool use_colors) {
  auto sink = logging::add_console_log(std::cout);
  if (use_colors) {
    sink->set_formatter([](const logging::record_view& rec, logging::formatting_ostream& strm) {
      auto severity = rec[logging::trivial::severity];
      const char* color = severity ? colorFor(*severity) : "";
      strm << color << rec[logging::expressions::smessage] << (*color != '\0' ? "\x1b[0m" : "");
    });
  } else {
    sink->set_formatter(logging::expressions::stream << logging::expressions::smessage);
  }
  sink->locked_backend()->auto_flush(true);
  logger_set_threshold(static_cast<logging::trivial::severity_level>(current_severity.load()));
}

void logger_set_threshold(logging::trivial::severity_level threshold) {
  current_severity = static_cast<int>(threshold);
  logging::core::get()->set_filter(logging::trivial::severity >= threshold);
}

void logger_set_threshold(int level) {
  const int clamped{std::min(std::max(level, static_cast<int>(logging::trivial::trace)),
                             static_cast<int>(logging::trivial::fatal))};
  logger_set_threshold(static_cast<logging::trivial::severity_level>(clamped));
}

int logger_get_severity() { return current_severity; }

}  // namespace yadwh
