#pragma once

#include "audio/audio_preprocessor.hpp"
#include "core/capability_registry.hpp"
#include "core/job_store.hpp"
#include "core/progress_reporter.hpp"
#include "core/scheduler.hpp"
#include "core/transcription_coordinator.hpp"
#include "export/transcript_exporter.hpp"
#include "utils/config.hpp"
#include <memory>
#include <string>
#include <vector>

namespace speechjobs {
namespace core {

/**
 * Answer to an accepted submission
 */
struct SubmissionReceipt {
    std::string job_id;
    JobStatus status = JobStatus::PENDING;
};

/**
 * Entry point for clients: admission, status, cancellation, deletion,
 * export and translation of finished transcripts.
 */
class TranscriptionService {
public:
    TranscriptionService(const utils::ServiceConfig& config,
                         std::shared_ptr<CapabilityRegistry> registry,
                         std::shared_ptr<audio::AudioPreprocessor> preprocessor);
    ~TranscriptionService();

    TranscriptionService(const TranscriptionService&) = delete;
    TranscriptionService& operator=(const TranscriptionService&) = delete;

    /**
     * Restore journaled jobs and start the workers
     */
    void start();
    void stop();

    /**
     * Validate an upload, copy it into upload_dir and queue a job for it.
     * Nothing is created when validation fails.
     * @param filePath Uploaded file
     * @param declaredName Client file name; its extension decides the format
     * @throws ValidationException for bad options, formats or sizes, or when
     *         the service cannot accept work
     * @throws ModelLoadException when the requested model already failed to load
     */
    SubmissionReceipt submit(const std::string& filePath, const std::string& declaredName,
                             const JobOptions& options);

    /**
     * @throws JobNotFoundException
     */
    JobSnapshot status(const std::string& jobId) const;
    std::vector<JobSnapshot> listJobs(size_t limit = 0) const;

    /**
     * @return false if the job is already terminal
     * @throws JobNotFoundException
     */
    bool cancel(const std::string& jobId);

    /**
     * Delete a finished job, its prepared audio and its stored upload
     * @throws JobNotFoundException, InvalidStateException
     */
    void remove(const std::string& jobId);

    /**
     * @throws InvalidStateException unless the job completed
     */
    std::string exportResult(const std::string& jobId, exporting::ExportFormat format,
                             const exporting::SpeakerNames& speakerNames = {}) const;

    /**
     * Translate the full text of a completed job
     * @throws InvalidStateException unless the job completed
     * @throws TranslationException, ModelLoadException
     */
    std::string translateTranscript(const std::string& jobId, const std::string& targetLanguage);

    ProgressReporter& progress() { return *reporter_; }
    SchedulerStats stats() const { return scheduler_->getStats(); }
    const std::shared_ptr<JobStore>& store() const { return store_; }

private:
    stt::TranscriptionResult runPipeline(const JobSnapshot& job, const CancellationToken& token,
                                         const ProgressCallback& progress);
    std::string storeUpload(const std::string& filePath, const std::string& declaredName) const;
    JobSnapshot requireCompleted(const std::string& jobId) const;

    utils::ServiceConfig config_;
    std::shared_ptr<CapabilityRegistry> registry_;
    std::shared_ptr<audio::AudioPreprocessor> preprocessor_;
    std::shared_ptr<JobStore> store_;
    std::unique_ptr<TranscriptionCoordinator> coordinator_;
    std::unique_ptr<ProgressReporter> reporter_;
    std::unique_ptr<Scheduler> scheduler_;
};

} // namespace core
} // namespace speechjobs
