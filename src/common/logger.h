#ifndef SHAMIR256_LOGGER_H
#define SHAMIR256_LOGGER_H

#include "errors.h"
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <string>

namespace shamir256 {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

/**
 * Console logger
 *
 * Lines look like "[INFO] [Component] message". DEBUG/INFO go to stdout,
 * WARN/ERROR to stderr. The level is process-wide and defaults to INFO.
 */
class Logger {
private:
    inline static std::atomic<int> level_{static_cast<int>(LogLevel::INFO)};
    inline static std::mutex mutex_;

public:
    static void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level));
    }

    static bool enabled(LogLevel level) {
        return static_cast<int>(level) >= level_.load() && level != LogLevel::OFF;
    }

    /**
     * Parse "DEBUG", "info", "Warn", ... (case-insensitive)
     *
     * @throws InvalidArgumentError for unknown names
     */
    static LogLevel parseLevel(const std::string& name) {
        std::string upper = name;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == "DEBUG") return LogLevel::DEBUG;
        if (upper == "INFO") return LogLevel::INFO;
        if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
        if (upper == "ERROR") return LogLevel::ERROR;
        if (upper == "OFF") return LogLevel::OFF;
        throw InvalidArgumentError("Unknown log level: " + name);
    }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::OFF: return "OFF";
        }
        return "?";
    }

    static void log(LogLevel level, const std::string& component, const std::string& message) {
        if (!enabled(level)) return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        out << "[" << levelName(level) << "] [" << component << "] " << message << "\n";
    }

    static void debug(const std::string& component, const std::string& message) {
        log(LogLevel::DEBUG, component, message);
    }

    static void info(const std::string& component, const std::string& message) {
        log(LogLevel::INFO, component, message);
    }

    static void error(const std::string& component, const std::string& message) {
        log(LogLevel::ERROR, component, message);
    }
};

} // namespace shamir256

#endif // SHAMIR256_LOGGER_H
