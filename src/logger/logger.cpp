#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <iostream>

namespace ftecho::logging {

void init_logging(const std::string& log_file, boost::log::trivial::severity_level min_level) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  // Remove any existing sinks to prevent duplicates
  logging::core::get()->remove_all_sinks();
  logging::add_common_attributes();

  auto format = (
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << logging::trivial::severity << "]"
      << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " " << expr::smessage
  );

  logging::add_console_log(std::clog, keywords::format = format, keywords::auto_flush = true);

  if (!log_file.empty()) {
    logging::add_file_log(
      keywords::file_name = log_file,
      keywords::format = format,
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true
    );
  }

  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
  BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized" << (log_file.empty() ? "" : " with file: ") << log_file;
}

bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level) {
  return boost::log::trivial::from_string(name.c_str(), name.size(), level);
}

} // namespace ftecho::logging
