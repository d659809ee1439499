#ifndef XS_LOGGER_HPP
#define XS_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace xs {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace".."fatal"; throws std::invalid_argument
severity_level parse_severity(const std::string& name);

// Replaces all sinks with a synchronous text file sink
void init_logging(const std::string& log_file = "xs.log",
                  severity_level min_level = severity_level::info);
// Replaces all sinks with a console sink on stderr
void init_console_logging(severity_level min_level = severity_level::info);
// Changes the minimum severity of every sink
void set_log_level(severity_level min_level);

} // namespace logger
} // namespace xs

#endif // XS_LOGGER_HPP
