#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace dfp::logging {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

boost::log::trivial::severity_level parse_severity(const std::string& level) {
  std::string lowered(level);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace")   return logging::trivial::trace;
  if (lowered == "debug")   return logging::trivial::debug;
  if (lowered == "info")    return logging::trivial::info;
  if (lowered == "warning" || lowered == "warn") return logging::trivial::warning;
  if (lowered == "error")   return logging::trivial::error;
  if (lowered == "fatal")   return logging::trivial::fatal;
  throw std::invalid_argument("Unknown log level: " + level);
}

void init_logging(const LogSettings& settings) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    if (settings.console) {
      logging::add_console_log(std::clog, keywords::format = format, keywords::auto_flush = true);
    }

    if (!settings.log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(settings.log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::format = format,
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::auto_flush = true
      );
    }

    set_log_level(settings.min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level level) {
  logging::core::get()->set_filter(logging::trivial::severity >= level);
}

} // namespace dfp::logging
