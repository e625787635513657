#include "core/transcription_coordinator.hpp"
#include "core/capability_call.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace speechjobs {
namespace core {

TranscriptionCoordinator::TranscriptionCoordinator(std::shared_ptr<CapabilityRegistry> registry,
                                                   const utils::ServiceConfig& config)
    : registry_(std::move(registry))
    , device_(config.whisper.device)
    , retry_(config.retry)
    , merger_(diar::MergePolicy::fromSettings(config.diarization)) {
}

stt::TranscriptionResult TranscriptionCoordinator::run(const Job& job, const audio::AudioAsset& asset,
                                                       const CancellationToken& token,
                                                       const ProgressCallback& progress) const {
    stt::TranscriptionResult result;
    std::string detectedLanguage;

    auto segments = transcribeChunks(job, asset, token, progress, detectedLanguage);

    if (job.options.enable_diarization) {
        // A diarizer that cannot be loaded fails the job like any other model load
        auto diarizer = registry_->diarizer(kDefaultDiarizerModel, device_);
        token.throwIfCancelled();

        const std::string audioPath = asset.path();
        auto outcome = invokeWithRetry([&]() {
            return diarizer.use([&](diar::Diarizer& d) {
                return d.diarize(audioPath, job.options.num_speakers);
            });
        }, retry_, token, "Diarization of job " + job.id);
        token.throwIfCancelled();

        if (outcome.isFatal()) {
            if (outcome.error().kind == utils::ErrorKind::MODEL_LOAD) {
                utils::error_utils::throwError(outcome.error());
            }
            outcome = CallOutcome<std::vector<diar::SpeakerTurn>>::degraded(
                {}, kDiarizationWarningPrefix + outcome.error().message);
        }

        if (progress) progress(progress_milestones::kDiarized);

        if (outcome.isDegraded()) {
            utils::Logger::warn("Job " + job.id + ": " + outcome.warning());
            result.warnings.push_back(outcome.warning());
            for (auto& segment : segments) {
                segment.speaker.reset();
            }
        } else {
            segments = merger_.merge(segments, outcome.value());
            if (progress) progress(progress_milestones::kMerged);
        }
    }

    result.segments = std::move(segments);
    result.text = stt::joinSegmentText(result.segments);
    result.duration = asset.duration();
    if (!detectedLanguage.empty()) {
        result.language = detectedLanguage;
    } else if (job.options.language && !job.options.language->empty()) {
        result.language = *job.options.language;
    } else {
        result.language = "unknown";
    }
    return result;
}

std::vector<stt::TranscriptSegment> TranscriptionCoordinator::transcribeChunks(
    const Job& job, const audio::AudioAsset& asset, const CancellationToken& token,
    const ProgressCallback& progress, std::string& detectedLanguage) const {

    auto transcriber = registry_->transcriber(modelSizeToString(job.options.model_size), device_);
    token.throwIfCancelled();

    std::vector<audio::AudioChunk> chunks = asset.chunks();
    if (chunks.empty()) {
        audio::AudioChunk whole;
        whole.path = asset.path();
        whole.duration = asset.duration();
        chunks.push_back(whole);
    }

    std::vector<stt::TranscriptSegment> segments;
    const auto total = static_cast<int>(chunks.size());

    for (int i = 0; i < total; ++i) {
        const auto& chunk = chunks[static_cast<size_t>(i)];
        auto outcome = invokeWithRetry([&]() {
            return transcriber.use([&](stt::Transcriber& t) {
                return t.transcribe(chunk.path, job.options.language);
            });
        }, retry_, token, "Transcription of job " + job.id + " chunk " + std::to_string(i + 1) +
                          "/" + std::to_string(total));

        if (outcome.isFatal()) {
            utils::error_utils::throwError(outcome.error());
        }
        token.throwIfCancelled();

        auto& output = outcome.value();
        if (detectedLanguage.empty() && !output.language.empty()) {
            detectedLanguage = output.language;
        }

        for (auto& segment : output.segments) {
            segment.start += chunk.offset;
            segment.end += chunk.offset;
            for (auto& word : segment.words) {
                word.start += chunk.offset;
                word.end += chunk.offset;
            }
            segments.push_back(std::move(segment));
        }

        if (progress) {
            int span = progress_milestones::kTranscriptionEnd - progress_milestones::kTranscriptionStart;
            progress(progress_milestones::kTranscriptionStart + span * (i + 1) / total);
        }
    }

    // Chunk boundaries may leave a segment starting before its predecessor ends
    stt::normalizeSegments(segments);

    utils::Logger::debug("Job " + job.id + " transcribed " + std::to_string(total) + " chunk(s) into " +
                         std::to_string(segments.size()) + " segments");
    return segments;
}

} // namespace core
} // namespace speechjobs
