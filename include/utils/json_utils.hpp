#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace speechjobs {
namespace utils {

/**
 * UTC timestamp in ISO 8601 with millisecond precision,
 * e.g. "2024-05-01T12:30:00.250Z"
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);

/**
 * Parse a timestamp produced by formatTimestamp()
 * @throws ValidationException on malformed input
 */
std::chrono::system_clock::time_point parseTimestamp(const std::string& text);

/**
 * Read and parse a JSON document from disk
 * @throws ValidationException if the file is missing or not valid JSON
 */
nlohmann::json readJsonFile(const std::string& path);

/**
 * Write a JSON document to a temporary file beside the target and rename it
 * into place, so readers never observe a partial document.
 * @return false if the document could not be written
 */
bool writeJsonFileAtomically(const std::string& path, const nlohmann::json& document);

} // namespace utils
} // namespace speechjobs
