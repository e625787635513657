#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace speechjobs {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize() {
    if (!initialized_) {
        initialized_ = true;
        if (const char* env = std::getenv("SPEECHJOBS_LOG_LEVEL")) {
            setLevel(std::string(env));
        }
        debug("Logger initialized");
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::setLevel(const std::string& level) {
    setLevel(parseLevel(level));
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

LogLevel Logger::parseLevel(const std::string& level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "error") {
        return LogLevel::ERROR;
    } else if (lowered == "warn" || lowered == "warning") {
        return LogLevel::WARN;
    } else if (lowered == "debug" || lowered == "trace") {
        return LogLevel::DEBUG;
    }
    return LogLevel::INFO;
}

void Logger::info(const std::string &message) {
    write(LogLevel::INFO, "INFO", message);
}

void Logger::warn(const std::string &message) {
    write(LogLevel::WARN, "WARN", message);
}

void Logger::error(const std::string &message) {
    write(LogLevel::ERROR, "ERROR", message);
}

void Logger::debug(const std::string &message) {
    write(LogLevel::DEBUG, "DEBUG", message);
}

void Logger::write(LogLevel level, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) > static_cast<int>(level_)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream line;
    line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "."
         << std::setfill('0') << std::setw(3) << ms << "] "
         << "[" << tag << "] " << message;

    if (level == LogLevel::ERROR) {
        std::cerr << line.str() << std::endl;
    } else {
        std::cout << line.str() << std::endl;
    }
}

} // namespace utils
} // namespace speechjobs
