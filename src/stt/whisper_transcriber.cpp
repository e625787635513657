#include "stt/whisper_transcriber.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cctype>
#include <filesystem>
#include <memory>

#include "whisper.h"

namespace speechjobs {
namespace stt {

namespace {

// whisper timestamps are in units of 10 ms
double toSeconds(int64_t t) {
    return static_cast<double>(t) * 0.01;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

bool isBlankMarker(const std::string& text) {
    return text.empty() || text == "[BLANK_AUDIO]" || text == "(silence)";
}

struct StateDeleter {
    void operator()(whisper_state* state) const {
        if (state) whisper_free_state(state);
    }
};

} // namespace

std::string WhisperModelConfig::modelFile() const {
    return (std::filesystem::path(models_path) / ("ggml-" + model_size + ".bin")).string();
}

WhisperTranscriber::WhisperTranscriber(const WhisperModelConfig& config)
    : model_path_(config.modelFile())
    , threads_(config.threads > 0 ? config.threads : 1) {

    std::error_code ec;
    if (!std::filesystem::is_regular_file(model_path_, ec)) {
        throw utils::ModelLoadException("Model file not found or not readable", model_path_);
    }

    whisper_context_params ctx_params = whisper_context_default_params();
    ctx_params.use_gpu = config.device != "cpu";

    ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), ctx_params);
    if (!ctx_) {
        throw utils::ModelLoadException("Failed to load whisper model", model_path_);
    }

    utils::Logger::info("Whisper model loaded: " + model_path_ + " (" +
                        whisper_model_type_readable(ctx_) + ", " + config.device + ")");
}

WhisperTranscriber::~WhisperTranscriber() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

TranscriptionOutput WhisperTranscriber::transcribe(const std::string& audioPath,
                                                   const std::optional<std::string>& languageHint) {
    audio::PcmAudio pcm;
    try {
        pcm = audio::WavCodec::readFile(audioPath);
    } catch (const utils::AudioProcessingException& e) {
        throw utils::TranscriptionException("Cannot read audio for recognition", e.what(), false);
    }
    std::vector<float> samples = audio::AudioFormatConverter::toTargetFormat(pcm);

    TranscriptionOutput output;
    output.duration = static_cast<double>(samples.size()) / audio::kTargetSampleRate;
    if (samples.empty()) {
        return output;
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = threads_;
    params.translate = false;
    params.no_context = true;
    params.single_segment = false;
    params.print_realtime = false;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.token_timestamps = true;
    params.suppress_blank = true;

    std::string language;
    if (languageHint && !languageHint->empty() && *languageHint != "auto") {
        if (whisper_lang_id(languageHint->c_str()) < 0) {
            throw utils::TranscriptionException("Unsupported language", *languageHint, false);
        }
        language = *languageHint;
        params.language = language.c_str();
        params.detect_language = false;
    } else {
        params.language = "auto";
        params.detect_language = false;
    }

    std::unique_ptr<whisper_state, StateDeleter> state(whisper_init_state(ctx_));
    if (!state) {
        throw utils::TranscriptionException("Failed to allocate whisper state");
    }

    int rc = whisper_full_with_state(ctx_, state.get(), params, samples.data(), static_cast<int>(samples.size()));
    if (rc != 0) {
        throw utils::TranscriptionException("whisper_full failed", "code " + std::to_string(rc));
    }

    TranscriptionOutput collected = collectSegments(state.get());
    output.segments = std::move(collected.segments);

    int langId = whisper_full_lang_id_from_state(state.get());
    if (langId >= 0) {
        output.language = whisper_lang_str(langId);
    } else {
        output.language = language;
    }

    utils::Logger::debug("Whisper produced " + std::to_string(output.segments.size()) + " segments for " +
                         audioPath);
    return output;
}

TranscriptionOutput WhisperTranscriber::collectSegments(whisper_state* state) const {
    TranscriptionOutput output;
    const int n_segments = whisper_full_n_segments_from_state(state);

    for (int i = 0; i < n_segments; ++i) {
        const char* raw = whisper_full_get_segment_text_from_state(state, i);
        std::string text = trim(raw ? raw : "");
        if (isBlankMarker(text)) {
            continue;
        }
        if (whisper_full_get_segment_no_speech_prob_from_state(state, i) > kNoSpeechThreshold) {
            continue;
        }

        TranscriptSegment segment;
        segment.id = static_cast<int>(output.segments.size());
        segment.text = text;
        segment.start = toSeconds(whisper_full_get_segment_t0_from_state(state, i));
        segment.end = toSeconds(whisper_full_get_segment_t1_from_state(state, i));

        float meanProbability = 0.0f;
        segment.words = extractWords(state, i, meanProbability);
        segment.confidence = meanProbability;

        if (segment.end > segment.start) {
            output.segments.push_back(std::move(segment));
        }
    }
    return output;
}

std::vector<Word> WhisperTranscriber::extractWords(whisper_state* state, int segmentIndex,
                                                   float& meanProbability) const {
    std::vector<Word> words;
    const int n_tokens = whisper_full_n_tokens_from_state(state, segmentIndex);
    const whisper_token eot = whisper_token_eot(ctx_);

    float probabilitySum = 0.0f;
    int tokenCount = 0;

    Word current;
    float wordProbabilitySum = 0.0f;
    int wordTokenCount = 0;

    auto finishWord = [&]() {
        std::string text = trim(current.text);
        if (!text.empty() && wordTokenCount > 0) {
            current.text = text;
            current.confidence = wordProbabilitySum / static_cast<float>(wordTokenCount);
            words.push_back(current);
        }
        current = Word();
        wordProbabilitySum = 0.0f;
        wordTokenCount = 0;
    };

    for (int j = 0; j < n_tokens; ++j) {
        whisper_token_data token = whisper_full_get_token_data_from_state(state, segmentIndex, j);
        if (token.id >= eot) {
            continue; // special tokens carry no text
        }

        const char* raw = whisper_full_get_token_text_from_state(ctx_, state, segmentIndex, j);
        std::string piece = raw ? raw : "";
        if (piece.empty()) {
            continue;
        }

        probabilitySum += token.p;
        ++tokenCount;

        // A leading space starts a new word
        if (!current.text.empty() && std::isspace(static_cast<unsigned char>(piece[0]))) {
            finishWord();
        }
        if (wordTokenCount == 0) {
            current.start = toSeconds(token.t0);
        }
        current.text += piece;
        current.end = toSeconds(token.t1);
        wordProbabilitySum += token.p;
        ++wordTokenCount;
    }
    finishWord();

    meanProbability = tokenCount > 0 ? probabilitySum / static_cast<float>(tokenCount) : 0.0f;
    return words;
}

} // namespace stt
} // namespace speechjobs
