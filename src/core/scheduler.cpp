#include "core/scheduler.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <chrono>

namespace speechjobs {
namespace core {

SchedulerConfig SchedulerConfig::fromServiceConfig(const utils::ServiceConfig& config) {
    SchedulerConfig schedulerConfig;
    schedulerConfig.max_concurrent_jobs = config.max_concurrent_jobs;
    schedulerConfig.max_queue_length = config.max_queue_length;
    schedulerConfig.maintenance = config.maintenance;
    return schedulerConfig;
}

Scheduler::Scheduler(std::shared_ptr<JobStore> store, JobPipeline pipeline, const SchedulerConfig& config)
    : store_(std::move(store))
    , pipeline_(std::move(pipeline))
    , config_(config)
    , running_(false)
    , stopping_(false)
    , active_jobs_(0)
    , completed_jobs_(0)
    , failed_jobs_(0)
    , canceled_jobs_(0) {
    if (config_.max_concurrent_jobs == 0) {
        config_.max_concurrent_jobs = 1; // Ensure at least one worker
    }
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    if (running_ || stopping_) {
        return;
    }
    running_ = true;

    workers_.reserve(config_.max_concurrent_jobs);
    for (size_t i = 0; i < config_.max_concurrent_jobs; ++i) {
        workers_.emplace_back(&Scheduler::workerLoop, this);
    }
    if (config_.maintenance.interval_seconds > 0) {
        maintenance_thread_ = std::thread(&Scheduler::maintenanceLoop, this);
    }

    utils::Logger::info("Scheduler started with " + std::to_string(config_.max_concurrent_jobs) + " workers");
}

void Scheduler::stop() {
    if (!running_) {
        return;
    }

    size_t drained = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        drained = queue_.size();
        // Queued jobs are started and failed by the workers; running jobs
        // observe the flag at their next checkpoint.
        for (auto& entry : tokens_) {
            entry.second->cancel(kShutdownReason);
        }
    }
    condition_.notify_all();
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
    }
    maintenance_condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    running_ = false;
    utils::Logger::info("Scheduler stopped (" + std::to_string(drained) + " queued jobs drained)");
}

bool Scheduler::submit(const std::string& jobId) {
    auto job = store_->find(jobId);
    if (!job || job->status != JobStatus::PENDING) {
        utils::Logger::warn("Refusing to queue job " + jobId + ": not a pending job");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) {
            return false;
        }
        if (!hasCapacityLocked()) {
            utils::Logger::warn("Queue full (" + std::to_string(queue_.size()) + "), rejecting job " + jobId);
            return false;
        }
        if (!enqueueLocked(jobId)) {
            return false;
        }
    }
    condition_.notify_one();

    utils::Logger::debug("Queued job " + jobId);
    return true;
}

Scheduler::SlotReservation Scheduler::reserve() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopping_ || !hasCapacityLocked()) {
        return SlotReservation();
    }
    ++reserved_slots_;
    return SlotReservation(this);
}

bool Scheduler::submit(const std::string& jobId, SlotReservation& reservation) {
    if (reservation.scheduler_ != this) {
        return submit(jobId);
    }

    auto job = store_->find(jobId);
    if (!job || job->status != JobStatus::PENDING) {
        utils::Logger::warn("Refusing to queue job " + jobId + ": not a pending job");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) {
            return false;
        }
        if (!enqueueLocked(jobId)) {
            return false;
        }
        --reserved_slots_;
        reservation.scheduler_ = nullptr;
    }
    condition_.notify_one();

    utils::Logger::debug("Queued job " + jobId + " into reserved slot");
    return true;
}

bool Scheduler::hasCapacityLocked() const {
    return config_.max_queue_length == 0 || queue_.size() + reserved_slots_ < config_.max_queue_length;
}

bool Scheduler::enqueueLocked(const std::string& jobId) {
    if (tokens_.count(jobId) > 0) {
        return false;
    }
    queue_.push_back(jobId);
    tokens_[jobId] = std::make_shared<CancellationToken>();
    return true;
}

Scheduler::SlotReservation& Scheduler::SlotReservation::operator=(SlotReservation&& other) noexcept {
    if (this != &other) {
        release();
        scheduler_ = other.scheduler_;
        other.scheduler_ = nullptr;
    }
    return *this;
}

void Scheduler::SlotReservation::release() {
    if (!scheduler_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(scheduler_->mutex_);
        --scheduler_->reserved_slots_;
    }
    scheduler_ = nullptr;
}

bool Scheduler::cancel(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(jobId);
    if (it == tokens_.end()) {
        return false;
    }
    it->second->cancel();
    utils::Logger::info("Cancellation requested for job " + jobId);
    return true;
}

bool Scheduler::canAccept() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stopping_ && hasCapacityLocked();
}

size_t Scheduler::getQueueLength() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

SchedulerStats Scheduler::getStats() const {
    SchedulerStats stats;
    stats.queued = getQueueLength();
    stats.processing = active_jobs_;
    stats.completed = completed_jobs_;
    stats.failed = failed_jobs_;
    stats.canceled = canceled_jobs_;
    return stats;
}

void Scheduler::workerLoop() {
    while (true) {
        std::string jobId;
        CancellationTokenPtr token;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return !queue_.empty() || stopping_; });
            if (queue_.empty()) {
                break;
            }
            jobId = std::move(queue_.front());
            queue_.pop_front();
            token = tokens_[jobId];
        }

        execute(jobId, token);

        std::lock_guard<std::mutex> lock(mutex_);
        tokens_.erase(jobId);
    }
}

void Scheduler::execute(const std::string& jobId, const CancellationTokenPtr& token) {
    JobSnapshot snapshot;
    try {
        snapshot = store_->transition(jobId, JobEvent::start());
    } catch (const utils::SpeechJobsException& e) {
        utils::Logger::error("Cannot start job " + jobId + ": " + e.what());
        return;
    }

    active_jobs_++;
    try {
        token->throwIfCancelled();

        ProgressCallback progress = [this, &jobId](int value) {
            store_->transition(jobId, JobEvent::progressTo(value));
        };
        auto result = pipeline_(snapshot, *token, progress);
        store_->transition(jobId, JobEvent::complete(std::move(result)));
        completed_jobs_++;

    } catch (const utils::CanceledException& e) {
        canceled_jobs_++;
        utils::Logger::info("Job " + jobId + " canceled: " + e.getErrorInfo().message);
        failJob(jobId, utils::error_utils::errorKindToCode(utils::ErrorKind::CANCELED),
                e.getErrorInfo().message);

    } catch (const std::exception& e) {
        auto info = utils::error_utils::classify(e);
        info.context = "Job " + jobId;
        utils::ErrorHandler::getInstance().reportError(info);

        std::string message = info.message;
        if (info.kind != utils::ErrorKind::INTERNAL && !info.details.empty()) {
            message += ": " + info.details;
        }
        failJob(jobId, utils::error_utils::errorKindToCode(info.kind), message);

    } catch (...) {
        utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
            utils::ErrorKind::INTERNAL, utils::ErrorSeverity::CRITICAL,
            "Unknown exception in job pipeline", "", "Job " + jobId));
        failJob(jobId, utils::error_utils::errorKindToCode(utils::ErrorKind::INTERNAL),
                "Unexpected internal error");
    }
    active_jobs_--;
}

void Scheduler::failJob(const std::string& jobId, const std::string& code, const std::string& message) {
    try {
        store_->transition(jobId, JobEvent::fail(code, message));
        failed_jobs_++;
    } catch (const utils::SpeechJobsException& e) {
        utils::Logger::error("Failed to record failure of job " + jobId + ": " + e.what());
    }
}

void Scheduler::maintenanceLoop() {
    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    const auto interval = std::chrono::seconds(config_.maintenance.interval_seconds);

    while (!stopping_) {
        if (maintenance_condition_.wait_for(lock, interval, [this] { return stopping_.load(); })) {
            break;
        }
        lock.unlock();
        runMaintenance();
        lock.lock();
    }
}

void Scheduler::runMaintenance() {
    if (config_.maintenance.retention_hours > 0) {
        store_->purgeExpired(std::chrono::hours(config_.maintenance.retention_hours));
    }

    if (config_.maintenance.stuck_job_warning_seconds > 0) {
        auto stuck = store_->findStuck(std::chrono::seconds(config_.maintenance.stuck_job_warning_seconds));
        for (const auto& job : stuck) {
            utils::Logger::warn("Job " + job->id + " has been processing for over " +
                                std::to_string(config_.maintenance.stuck_job_warning_seconds) +
                                "s (progress " + std::to_string(job->progress) + "%)");
        }
    }
}

} // namespace core
} // namespace speechjobs
