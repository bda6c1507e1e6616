#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace chunkvault::logging {

namespace {

// Shared by the console and file sinks
auto make_formatter() {
    namespace expr = boost::log::expressions;
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "]"
        << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage;
}

} // namespace

boost::log::trivial::severity_level parse_severity(const std::string& level) {
    boost::log::trivial::severity_level parsed;
    if (!boost::log::trivial::from_string(level.c_str(), level.size(), parsed)) {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    return parsed;
}

void init_logging(const LogConfig& config) {
    namespace keywords = boost::log::keywords;

    const auto level = parse_severity(config.level);

    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();
        boost::log::add_common_attributes();

        if (config.console) {
            boost::log::add_console_log(
                std::clog,
                keywords::format = make_formatter(),
                keywords::auto_flush = true
            );
        }

        if (!config.log_file.empty()) {
            boost::log::add_file_log(
                keywords::file_name = config.log_file,
                keywords::format = make_formatter(),
                keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::auto_flush = true
            );
        }

        set_log_level(level);
        boost::log::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }

    BOOST_LOG_TRIVIAL(info) << "Logging initialized at level " << config.level
                            << (config.log_file.empty() ? "" : ", file " + config.log_file);
}

void set_log_level(boost::log::trivial::severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

} // namespace chunkvault::logging
