#ifndef CHUNKVAULT_LOGGER_HPP
#define CHUNKVAULT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace chunkvault::logging {

struct LogConfig {
    // Minimum severity: trace, debug, info, warning, error or fatal
    std::string level{"info"};
    // Rotating file sink when non-empty
    std::string log_file;
    bool console{true};
};

// Parses a severity name, throws std::invalid_argument for unknown names
boost::log::trivial::severity_level parse_severity(const std::string& level);

// Replaces all sinks with the configured console and file sinks
void init_logging(const LogConfig& config);

// Changes the minimum severity of the installed sinks
void set_log_level(boost::log::trivial::severity_level level);

} // namespace chunkvault::logging

#endif // CHUNKVAULT_LOGGER_HPP
