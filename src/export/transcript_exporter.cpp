#include "export/transcript_exporter.hpp"
#include "core/job_json.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace speechjobs {
namespace exporting {

ExportFormat parseExportFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "txt") return ExportFormat::TXT;
    if (lower == "json") return ExportFormat::JSON;
    if (lower == "srt") return ExportFormat::SRT;
    throw utils::ValidationException("Unsupported export format", name);
}

std::string exportFormatToString(ExportFormat format) {
    switch (format) {
        case ExportFormat::TXT: return "txt";
        case ExportFormat::JSON: return "json";
        case ExportFormat::SRT: return "srt";
    }
    return "txt";
}

std::optional<std::string> TranscriptExporter::displayName(const std::optional<std::string>& speaker,
                                                           const SpeakerNames& names) {
    if (!speaker) {
        return std::nullopt;
    }
    auto it = names.find(*speaker);
    if (it != names.end() && !it->second.empty()) {
        return it->second;
    }
    return speaker;
}

std::string TranscriptExporter::toText(const stt::TranscriptionResult& result, const SpeakerNames& names) {
    std::ostringstream out;
    bool first = true;
    for (const auto& segment : result.segments) {
        if (!first) {
            out << "\n\n";
        }
        first = false;

        auto speaker = displayName(segment.speaker, names);
        if (speaker) {
            out << "[" << *speaker << "]: ";
        }
        out << segment.text;
    }
    return out.str();
}

std::string TranscriptExporter::toJson(const stt::TranscriptionResult& result, const SpeakerNames& names) {
    nlohmann::json j = result;
    j["speaker_names"] = nlohmann::json::object();
    for (const auto& entry : names) {
        j["speaker_names"][entry.first] = entry.second;
    }
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string TranscriptExporter::toSrt(const stt::TranscriptionResult& result, const SpeakerNames& names) {
    std::ostringstream out;
    size_t index = 1;
    for (const auto& segment : result.segments) {
        if (index > 1) {
            out << "\n";
        }
        out << index++ << "\n"
            << formatSrtTimestamp(segment.start) << " --> " << formatSrtTimestamp(segment.end) << "\n";

        auto speaker = displayName(segment.speaker, names);
        if (speaker) {
            out << "[" << *speaker << "] ";
        }
        out << segment.text << "\n";
    }
    return out.str();
}

std::string TranscriptExporter::render(const stt::TranscriptionResult& result, ExportFormat format,
                                       const SpeakerNames& names) {
    switch (format) {
        case ExportFormat::TXT: return toText(result, names);
        case ExportFormat::JSON: return toJson(result, names);
        case ExportFormat::SRT: return toSrt(result, names);
    }
    return toText(result, names);
}

std::string TranscriptExporter::formatSrtTimestamp(double seconds) {
    long long totalMs = std::llround(std::max(0.0, seconds) * 1000.0);
    long long hours = totalMs / 3600000;
    long long minutes = (totalMs / 60000) % 60;
    long long secs = (totalMs / 1000) % 60;
    long long millis = totalMs % 1000;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld,%03lld", hours, minutes, secs, millis);
    return buffer;
}

} // namespace exporting
} // namespace speechjobs
