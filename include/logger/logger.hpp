#ifndef FTECHO_LOGGER_HPP
#define FTECHO_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace ftecho::logging {

// Installs a console sink and, if log_file is not empty, a rotating file sink.
// Records below min_level are dropped.
void init_logging(const std::string& log_file = std::string(),
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level);

} // namespace ftecho::logging

#endif // FTECHO_LOGGER_HPP
