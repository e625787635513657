#pragma once

#include "stt/transcript.hpp"
#include <map>
#include <optional>
#include <string>

namespace speechjobs {
namespace exporting {

enum class ExportFormat {
    TXT,
    JSON,
    SRT
};

/**
 * @throws ValidationException for names other than txt, json and srt
 */
ExportFormat parseExportFormat(const std::string& name);
std::string exportFormatToString(ExportFormat format);

/**
 * Speaker id -> display name
 */
using SpeakerNames = std::map<std::string, std::string>;

/**
 * Renders a completed transcription. Speakers without an entry in the
 * display-name map are shown by their label.
 */
class TranscriptExporter {
public:
    /**
     * Segments separated by blank lines, each prefixed "[speaker]: " when labeled
     */
    static std::string toText(const stt::TranscriptionResult& result, const SpeakerNames& names = {});

    /**
     * The full result verbatim plus the "speaker_names" display-name map
     */
    static std::string toJson(const stt::TranscriptionResult& result, const SpeakerNames& names = {});

    /**
     * SubRip cues numbered from 1, text prefixed "[speaker] " when labeled
     */
    static std::string toSrt(const stt::TranscriptionResult& result, const SpeakerNames& names = {});

    static std::string render(const stt::TranscriptionResult& result, ExportFormat format,
                              const SpeakerNames& names = {});

    /**
     * HH:MM:SS,mmm
     */
    static std::string formatSrtTimestamp(double seconds);

private:
    static std::optional<std::string> displayName(const std::optional<std::string>& speaker,
                                                  const SpeakerNames& names);
};

} // namespace exporting
} // namespace speechjobs
