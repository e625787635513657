#pragma once

#include "stt/transcript.hpp"
#include <optional>
#include <string>

namespace speechjobs {
namespace stt {

/**
 * Speech-recognition capability. Implementations load their model on
 * construction; the CapabilityRegistry owns and shares instances.
 */
class Transcriber {
public:
    virtual ~Transcriber() = default;

    /**
     * Transcribe a mono 16 kHz WAV file
     * @param audioPath Path to the normalized audio
     * @param languageHint ISO language code, or nullopt for auto-detection
     * @return Segments relative to the start of the file, detected language and duration
     * @throws TranscriptionException on recognition failure
     */
    virtual TranscriptionOutput transcribe(const std::string& audioPath,
                                           const std::optional<std::string>& languageHint) = 0;
};

} // namespace stt
} // namespace speechjobs
