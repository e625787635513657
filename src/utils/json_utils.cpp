#include "utils/json_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace speechjobs {
namespace utils {

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;
    if (ms < 0) {
        ms += 1000;
        seconds -= 1;
    }

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "."
       << std::setfill('0') << std::setw(3) << ms << "Z";
    return ss.str();
}

std::chrono::system_clock::time_point parseTimestamp(const std::string& text) {
    std::tm tm_buf{};
    int millis = 0;
    std::istringstream ss(text);
    ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw ValidationException("Invalid timestamp", text);
    }
    if (ss.peek() == '.') {
        ss.get();
        ss >> millis;
    }

    std::time_t seconds = timegm(&tm_buf);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationException("Cannot open JSON file", path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationException("Invalid JSON in " + path, e.what());
    }
}

bool writeJsonFileAtomically(const std::string& path, const nlohmann::json& document) {
    namespace fs = std::filesystem;
    fs::path target(path);
    fs::path temp = target;
    temp += ".tmp";

    // Recognizer output and upload names are not guaranteed to be valid UTF-8
    std::string text;
    try {
        text = document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Failed to serialize " + target.string() + ": " + e.what());
        return false;
    }

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Failed to open " + temp.string() + " for writing");
            return false;
        }
        file << text;
        if (!file.good()) {
            Logger::error("Failed to write " + temp.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        Logger::error("Failed to publish " + target.string() + ": " + ec.message());
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

} // namespace utils
} // namespace speechjobs
