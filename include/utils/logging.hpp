#pragma once

#include <mutex>
#include <string>

namespace speechjobs {
namespace utils {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger {
public:
    /**
     * Initialize the logger. Reads SPEECHJOBS_LOG_LEVEL when set.
     */
    static void initialize();

    static void setLevel(LogLevel level);
    static void setLevel(const std::string& level);
    static LogLevel getLevel();

    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    /**
     * Parse a level name ("error", "warn", "info", "debug"), case-insensitive.
     * Unknown names map to INFO.
     */
    static LogLevel parseLevel(const std::string& level);

private:
    static void write(LogLevel level, const char* tag, const std::string& message);

    static bool initialized_;
    static LogLevel level_;
    static std::mutex mutex_;
};

} // namespace utils
} // namespace speechjobs
