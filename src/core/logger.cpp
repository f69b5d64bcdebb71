/**
 * @file logger.cpp
 * @brief Implements console, file and in-memory logging.
 */

#include "core/logger.hpp"
#include "core/errors.hpp"

#include <iostream>
#include <stdexcept>

namespace core {

namespace {

const LiveClock& wallClock() {
    static const LiveClock clock;
    return clock;
}

}

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel logLevelFromString(const std::string& name) {
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARNING") return LogLevel::WARNING;
    if (name == "ERROR") return LogLevel::ERROR;
    throw InvalidConfiguration("unknown log level '" + name + "'");
}

Logger::Logger(const std::string& name, const Clock& clock, const LoggingOptions& options)
    : name_(name), clock_(clock), options_(options) {
    if (options_.log_to_file && !options_.bypass_logging) {
        file_.open(options_.log_file_path, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + options_.log_file_path);
        }
        file_ << "# " << name_ << "\n";
    }
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (options_.bypass_logging) return;

    std::string line = formatTimestamp(clock_.timeNow())
        + " [" + toString(level) + "] [" + component + "] " + message;

    if (options_.console_prints && level >= options_.level_console) {
        if (level == LogLevel::ERROR) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << "\n";
        }
    }

    if (file_.is_open() && level >= options_.level_file) {
        file_ << line << "\n";
    }

    if (level >= options_.level_store) {
        store_.push_back(line);
    }
}

LiveLogger::LiveLogger(const std::string& name, const LoggingOptions& options)
    : Logger(name, wallClock(), options) {}

}
