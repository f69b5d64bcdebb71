/**
 * @file logger.hpp
 * @brief Declares the logger used by the engine, its collaborators and strategies.
 */

#pragma once

#include "core/clock.hpp"

#include <fstream>
#include <string>
#include <vector>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

std::string toString(LogLevel level);

/**
 * @brief Parses "DEBUG", "INFO", "WARNING" or "ERROR".
 * @throws InvalidConfiguration if the name is unknown
 */
LogLevel logLevelFromString(const std::string& name);

/**
 * @struct LoggingOptions
 * @brief Verbosity and destination options for a Logger.
 */
struct LoggingOptions {
    LogLevel level_console = LogLevel::INFO;   ///< Minimum level printed to the console
    LogLevel level_file = LogLevel::DEBUG;     ///< Minimum level written to the log file
    LogLevel level_store = LogLevel::WARNING;  ///< Minimum level kept in memory
    bool console_prints = true;
    bool log_to_file = false;
    std::string log_file_path = "logs/backtest.log";
    bool bypass_logging = false;               ///< Suppress every sink
};

/**
 * @class Logger
 * @brief Writes timestamped, levelled lines to the console, a file and an in-memory store.
 *
 * Lines have the form "<timestamp> [LEVEL] [component] message". The timestamp
 * comes from the clock the logger was built with.
 */
class Logger {
public:
    /**
     * @brief Constructs a Logger.
     * @param name Logger name, written to the file header
     * @param clock Time source for line timestamps; must outlive the logger
     * @param options Verbosity and destinations
     * @throws std::runtime_error if the log file cannot be opened
     */
    Logger(const std::string& name, const Clock& clock, const LoggingOptions& options);
    virtual ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message) {
        log(LogLevel::DEBUG, component, message);
    }
    void info(const std::string& component, const std::string& message) {
        log(LogLevel::INFO, component, message);
    }
    void warning(const std::string& component, const std::string& message) {
        log(LogLevel::WARNING, component, message);
    }
    void error(const std::string& component, const std::string& message) {
        log(LogLevel::ERROR, component, message);
    }

    /**
     * @brief Returns the lines kept in memory (level >= level_store).
     */
    const std::vector<std::string>& storedMessages() const { return store_; }

    void clearStore() { store_.clear(); }

    const std::string& name() const { return name_; }
    const LoggingOptions& options() const { return options_; }

private:
    std::string name_;
    const Clock& clock_;
    LoggingOptions options_;
    std::ofstream file_;
    std::vector<std::string> store_;
};

/**
 * @class LiveLogger
 * @brief Logger stamped with wall-clock time.
 */
class LiveLogger : public Logger {
public:
    explicit LiveLogger(const std::string& name, const LoggingOptions& options = {});
};

/**
 * @class TestLogger
 * @brief Logger stamped with simulated time.
 */
class TestLogger : public Logger {
public:
    TestLogger(const std::string& name, const TestClock& clock, const LoggingOptions& options = {})
        : Logger(name, clock, options) {}
};

/**
 * @class LoggerAdapter
 * @brief Binds a component name to a Logger.
 */
class LoggerAdapter {
public:
    LoggerAdapter(const std::string& component, Logger& logger)
        : component_(component), logger_(&logger) {}

    void debug(const std::string& message) const { logger_->debug(component_, message); }
    void info(const std::string& message) const { logger_->info(component_, message); }
    void warning(const std::string& message) const { logger_->warning(component_, message); }
    void error(const std::string& message) const { logger_->error(component_, message); }

    Logger& logger() const { return *logger_; }

private:
    std::string component_;
    Logger* logger_;
};

}
