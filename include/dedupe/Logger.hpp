/**
 * @file Logger.hpp
 * @brief Leveled logging capability injected into the processor
 *
 * Library code never logs through a global: every component that reports
 * progress takes a Logger& and the caller decides where messages go.
 * - NullLogger: discards everything (silent runs, tests)
 * - BoostLogger: forwards to Boost.Log's trivial logger
 */

#ifndef DEDUPE_LOGGER_HPP
#define DEDUPE_LOGGER_HPP

#include <string>

namespace dedupe {

enum class LogLevel {
    info,
    warning,
    error,
    critical
};

/**
 * @brief Get the upper-case name of a level (e.g. "INFO")
 */
const char* level_name(LogLevel level) noexcept;

/**
 * @brief Abstract leveled logger
 */
class Logger {
public:
    virtual ~Logger() = default;

    /**
     * @brief Emit one message at the given level
     */
    virtual void log(LogLevel level, const std::string& message) = 0;

    void info(const std::string& message) { log(LogLevel::info, message); }
    void warning(const std::string& message) { log(LogLevel::warning, message); }
    void error(const std::string& message) { log(LogLevel::error, message); }
    void critical(const std::string& message) { log(LogLevel::critical, message); }
};

/**
 * @brief Logger that drops every message
 */
class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

/**
 * @brief Logger backed by BOOST_LOG_TRIVIAL
 *
 * critical maps to Boost's fatal severity.
 */
class BoostLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override;
};

/**
 * @brief Configure Boost.Log's console sink for the command-line tool
 *
 * Format: "<timestamp> - dedupe - <severity> - <message>" on stderr,
 * minimum severity info.
 */
void init_console_logging();

} // namespace dedupe

#endif // DEDUPE_LOGGER_HPP
