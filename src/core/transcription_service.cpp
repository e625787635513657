#include "core/transcription_service.hpp"
#include "core/capability_call.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace speechjobs {
namespace core {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxStoredStemLength = 50;

std::string randomHex(size_t length) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream ss;
    for (size_t i = 0; i < length; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

} // namespace

TranscriptionService::TranscriptionService(const utils::ServiceConfig& config,
                                           std::shared_ptr<CapabilityRegistry> registry,
                                           std::shared_ptr<audio::AudioPreprocessor> preprocessor)
    : config_(config)
    , registry_(std::move(registry))
    , preprocessor_(std::move(preprocessor)) {

    std::shared_ptr<JobJournal> journal;
    if (!config_.journal_dir.empty()) {
        journal = std::make_shared<JobJournal>(config_.journal_dir);
    }
    store_ = std::make_shared<JobStore>(journal);

    // Stored uploads live as long as their job record
    store_->setRemovedCallback([](const Job& job) {
        if (job.source.stored_path.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove(job.source.stored_path, ec);
        if (ec) {
            utils::Logger::warn("Failed to delete upload " + job.source.stored_path + ": " + ec.message());
        }
    });

    coordinator_ = std::make_unique<TranscriptionCoordinator>(registry_, config_);
    reporter_ = std::make_unique<ProgressReporter>(store_);
    scheduler_ = std::make_unique<Scheduler>(
        store_,
        [this](const JobSnapshot& job, const CancellationToken& token, const ProgressCallback& progress) {
            return runPipeline(job, token, progress);
        },
        SchedulerConfig::fromServiceConfig(config_));
}

TranscriptionService::~TranscriptionService() {
    stop();
}

void TranscriptionService::start() {
    auto requeue = store_->recover();
    scheduler_->start();

    for (const auto& job : requeue) {
        if (!scheduler_->submit(job->id)) {
            utils::Logger::warn("Could not re-queue recovered job " + job->id);
        }
    }
    utils::Logger::info("Transcription service started");
}

void TranscriptionService::stop() {
    scheduler_->stop();
}

SubmissionReceipt TranscriptionService::submit(const std::string& filePath, const std::string& declaredName,
                                               const JobOptions& options) {
    if (options.num_speakers && *options.num_speakers < 1) {
        throw utils::ValidationException("num_speakers must be at least 1",
                                         std::to_string(*options.num_speakers));
    }

    std::error_code ec;
    auto byteSize = fs::file_size(filePath, ec);
    if (ec) {
        throw utils::ValidationException("Cannot read uploaded file", filePath + ": " + ec.message());
    }
    preprocessor_->validate(declaredName, byteSize);

    CapabilityKey transcriberKey{CapabilityKind::TRANSCRIBER, modelSizeToString(options.model_size),
                                 config_.whisper.device};
    if (registry_->hasFailed(transcriberKey)) {
        throw utils::ModelLoadException("Model failed to load earlier", transcriberKey.toString());
    }
    auto slot = scheduler_->reserve();
    if (!slot) {
        throw utils::ValidationException("Service is not accepting jobs",
                                         "queue length " + std::to_string(scheduler_->getQueueLength()));
    }

    std::string storedPath = storeUpload(filePath, declaredName);
    std::string jobId = store_->create(options, JobSource{declaredName, storedPath});

    if (!scheduler_->submit(jobId, slot)) {
        // Shutdown began after the slot was claimed
        store_->transition(jobId, JobEvent::start());
        store_->transition(jobId, JobEvent::fail(
            utils::error_utils::errorKindToCode(utils::ErrorKind::CANCELED), Scheduler::kShutdownReason));
    }

    return SubmissionReceipt{jobId, store_->get(jobId)->status};
}

std::string TranscriptionService::storeUpload(const std::string& filePath, const std::string& declaredName) const {
    fs::path declared(declaredName);
    std::string stem = declared.stem().string().substr(0, kMaxStoredStemLength);
    std::string fileName = randomHex(12) + "_" + stem + audio::AudioPreprocessor::extensionOf(declaredName);

    std::error_code ec;
    fs::create_directories(config_.upload_dir, ec);
    if (ec) {
        throw utils::ValidationException("Failed to save uploaded file", config_.upload_dir + ": " + ec.message());
    }

    fs::path destination = fs::path(config_.upload_dir) / fileName;
    fs::copy_file(filePath, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw utils::ValidationException("Failed to save uploaded file", ec.message());
    }

    utils::Logger::info("Saved upload " + declaredName + " to " + destination.string());
    return destination.string();
}

stt::TranscriptionResult TranscriptionService::runPipeline(const JobSnapshot& job, const CancellationToken& token,
                                                           const ProgressCallback& progress) {
    auto asset = preprocessor_->prepare(job->source.stored_path, job->source.file_name, job->id);
    store_->attachAsset(job->id, asset);
    if (progress) progress(progress_milestones::kAudioPrepared);
    token.throwIfCancelled();

    return coordinator_->run(*job, *asset, token, progress);
}

JobSnapshot TranscriptionService::status(const std::string& jobId) const {
    return reporter_->status(jobId);
}

std::vector<JobSnapshot> TranscriptionService::listJobs(size_t limit) const {
    return store_->list(limit);
}

bool TranscriptionService::cancel(const std::string& jobId) {
    auto job = store_->get(jobId);
    if (job->isTerminal()) {
        return false;
    }
    return scheduler_->cancel(jobId);
}

void TranscriptionService::remove(const std::string& jobId) {
    store_->remove(jobId);
}

JobSnapshot TranscriptionService::requireCompleted(const std::string& jobId) const {
    auto job = store_->get(jobId);
    if (job->status != JobStatus::COMPLETED || !job->result) {
        throw utils::InvalidStateException(
            "Job has no result (status '" + jobStatusToString(job->status) + "')", jobId);
    }
    return job;
}

std::string TranscriptionService::exportResult(const std::string& jobId, exporting::ExportFormat format,
                                               const exporting::SpeakerNames& speakerNames) const {
    auto job = requireCompleted(jobId);
    return exporting::TranscriptExporter::render(*job->result, format, speakerNames);
}

std::string TranscriptionService::translateTranscript(const std::string& jobId, const std::string& targetLanguage) {
    auto job = requireCompleted(jobId);
    const auto& result = *job->result;

    if (targetLanguage.empty()) {
        throw utils::ValidationException("Target language is required");
    }
    if (result.text.empty() || result.language == targetLanguage) {
        return result.text;
    }

    // Translation models are per language pair
    auto translator = registry_->translator(result.language + "-" + targetLanguage, config_.whisper.device);

    CancellationToken token;
    auto outcome = invokeWithRetry([&]() {
        return translator.use([&](mt::Translator& t) {
            return t.translate(result.text, result.language, targetLanguage);
        });
    }, config_.retry, token, "Translation of job " + jobId);

    if (outcome.isFatal()) {
        utils::error_utils::throwError(outcome.error());
    }
    return outcome.value();
}

} // namespace core
} // namespace speechjobs
