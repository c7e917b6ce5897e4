#ifndef DFP_LOGGER_HPP
#define DFP_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace dfp::logging {

struct LogSettings {
  // Empty disables the file sink
  std::string log_file;
  boost::log::trivial::severity_level min_level = boost::log::trivial::info;
  bool console = true;
};

// Parses "trace" ... "fatal" (case-insensitive); throws std::invalid_argument
boost::log::trivial::severity_level parse_severity(const std::string& level);

// Replaces all sinks with a console sink and, when configured, a rotating
// text file sink sharing one timestamp/thread/severity format
void init_logging(const LogSettings& settings);

// Changes the minimum severity without touching the sinks
void set_log_level(boost::log::trivial::severity_level level);

} // namespace dfp::logging

#endif // DFP_LOGGER_HPP
