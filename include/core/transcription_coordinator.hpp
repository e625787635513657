#pragma once

#include "audio/audio_preprocessor.hpp"
#include "core/cancellation.hpp"
#include "core/capability_registry.hpp"
#include "core/job.hpp"
#include "diar/diarization_merger.hpp"
#include "utils/config.hpp"
#include <functional>
#include <memory>
#include <string>

namespace speechjobs {
namespace core {

using ProgressCallback = std::function<void(int)>;

/**
 * Progress milestones reported while a job runs
 */
namespace progress_milestones {
constexpr int kAudioPrepared = 5;
constexpr int kTranscriptionStart = 10;
constexpr int kTranscriptionEnd = 80;
constexpr int kDiarized = 85;
constexpr int kMerged = 95;
} // namespace progress_milestones

/**
 * Runs the capabilities for one job against its prepared audio.
 *
 * Recognition runs once per chunk (or once for an unchunked asset) and the
 * per-chunk segments are shifted onto the asset timeline and renumbered.
 * When diarization is requested it runs once on the whole asset and the
 * DiarizationMerger assigns speakers. A recognition failure fails the job;
 * a diarization call failure leaves every speaker unset and adds a warning.
 */
class TranscriptionCoordinator {
public:
    TranscriptionCoordinator(std::shared_ptr<CapabilityRegistry> registry,
                             const utils::ServiceConfig& config);

    /**
     * @throws SpeechJobsException with the kind of the failure that ended the job
     * @throws CanceledException when the token is cancelled at a checkpoint
     */
    stt::TranscriptionResult run(const Job& job, const audio::AudioAsset& asset,
                                 const CancellationToken& token,
                                 const ProgressCallback& progress) const;

    static constexpr const char* kDefaultDiarizerModel = "default";
    static constexpr const char* kDiarizationWarningPrefix =
        "Speaker diarization failed; transcript has no speaker labels: ";

private:
    std::vector<stt::TranscriptSegment> transcribeChunks(const Job& job, const audio::AudioAsset& asset,
                                                         const CancellationToken& token,
                                                         const ProgressCallback& progress,
                                                         std::string& detectedLanguage) const;

    std::shared_ptr<CapabilityRegistry> registry_;
    std::string device_;
    utils::RetrySettings retry_;
    diar::DiarizationMerger merger_;
};

} // namespace core
} // namespace speechjobs
