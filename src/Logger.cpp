/**
 * @file Logger.cpp
 * @brief Boost.Log backend for the Logger capability
 */

#include "dedupe/Logger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>

namespace logging = boost::log;
namespace expr = boost::log::expressions;

namespace dedupe {

const char* level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::info: return "INFO";
        case LogLevel::warning: return "WARNING";
        case LogLevel::error: return "ERROR";
        case LogLevel::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

void BoostLogger::log(LogLevel level, const std::string& message) {
    switch (level) {
        case LogLevel::info:
            BOOST_LOG_TRIVIAL(info) << message;
            break;
        case LogLevel::warning:
            BOOST_LOG_TRIVIAL(warning) << message;
            break;
        case LogLevel::error:
            BOOST_LOG_TRIVIAL(error) << message;
            break;
        case LogLevel::critical:
            BOOST_LOG_TRIVIAL(fatal) << message;
            break;
    }
}

void init_console_logging() {
    logging::add_common_attributes();

    logging::add_console_log(
        std::clog,
        logging::keywords::format = (
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>(
                       "TimeStamp", "%Y-%m-%d %H:%M:%S,%f")
                << " - dedupe - "
                << logging::trivial::severity
                << " - " << expr::smessage
        )
    );

    logging::core::get()->set_filter(
        logging::trivial::severity >= logging::trivial::info
    );
}

} // namespace dedupe
