#pragma once

#include "stt/stt_interface.hpp"
#include <string>
#include <vector>

struct whisper_context;
struct whisper_state;

namespace speechjobs {
namespace stt {

struct WhisperModelConfig {
    std::string models_path = "models/";
    std::string model_size = "base";
    std::string device = "cpu";
    int threads = 4;

    /**
     * <models_path>/ggml-<model_size>.bin
     */
    std::string modelFile() const;
};

/**
 * whisper.cpp backed recognition. The model is loaded once in the
 * constructor; each transcribe() call runs on its own whisper_state, so one
 * instance may serve concurrent calls.
 */
class WhisperTranscriber : public Transcriber {
public:
    /**
     * @throws ModelLoadException if the model file is missing or invalid
     */
    explicit WhisperTranscriber(const WhisperModelConfig& config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    TranscriptionOutput transcribe(const std::string& audioPath,
                                   const std::optional<std::string>& languageHint) override;

    const std::string& modelPath() const { return model_path_; }

private:
    TranscriptionOutput collectSegments(whisper_state* state) const;
    std::vector<Word> extractWords(whisper_state* state, int segmentIndex, float& meanProbability) const;

    whisper_context* ctx_ = nullptr;
    std::string model_path_;
    int threads_;

    // Segments whisper itself flags as probably silent are dropped
    static constexpr float kNoSpeechThreshold = 0.6f;
};

} // namespace stt
} // namespace speechjobs
