#include "core/job_store.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace speechjobs {
namespace core {

JobStore::JobStore(std::shared_ptr<JobJournal> journal)
    : journal_(std::move(journal)) {
}

std::string JobStore::generateJobId() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (dis(gen) & 0xffffffffULL) << "-"
       << std::setw(4) << (dis(gen) & 0xffffULL) << "-"
       << std::setw(4) << ((dis(gen) & 0x0fffULL) | 0x4000ULL) << "-"
       << std::setw(4) << ((dis(gen) & 0x3fffULL) | 0x8000ULL) << "-"
       << std::setw(12) << (dis(gen) & 0xffffffffffffULL);
    return ss.str();
}

std::string JobStore::create(const JobOptions& options, const JobSource& source) {
    auto job = std::make_shared<Job>();
    job->status = JobStatus::PENDING;
    job->progress = 0;
    job->options = options;
    job->source = source;
    job->created_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        do {
            job->id = generateJobId();
        } while (jobs_.count(job->id) > 0);
        jobs_[job->id] = JobRecord{job, nullptr};
    }

    utils::Logger::info("Created job " + job->id + " for " +
                        (source.file_name.empty() ? std::string("<unnamed>") : source.file_name));
    persist(*job);
    notifyTransition(job);
    return job->id;
}

JobSnapshot JobStore::transition(const std::string& id, const JobEvent& event) {
    JobSnapshot published;
    audio::AudioAssetPtr released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            throw utils::JobNotFoundException(id);
        }

        const Job& current = *it->second.snapshot;
        auto illegal = [&]() {
            return utils::InvalidStateException(
                "Cannot apply '" + jobEventTypeToString(event.type) + "' to a job in state '" +
                jobStatusToString(current.status) + "'", id);
        };

        auto next = std::make_shared<Job>(current);
        auto now = std::chrono::system_clock::now();

        switch (event.type) {
            case JobEvent::Type::START:
                if (current.status != JobStatus::PENDING) {
                    throw illegal();
                }
                next->status = JobStatus::PROCESSING;
                next->started_at = now;
                break;

            case JobEvent::Type::PROGRESS: {
                if (current.status != JobStatus::PROCESSING) {
                    throw illegal();
                }
                int value = std::min(event.progress, 100);
                if (value <= current.progress) {
                    // Monotonic: stale or repeated progress is ignored
                    return it->second.snapshot;
                }
                next->progress = value;
                break;
            }

            case JobEvent::Type::COMPLETE:
                if (current.status != JobStatus::PROCESSING) {
                    throw illegal();
                }
                next->status = JobStatus::COMPLETED;
                next->progress = 100;
                next->result = event.result;
                next->completed_at = now;
                break;

            case JobEvent::Type::FAIL:
                if (current.status != JobStatus::PROCESSING) {
                    throw illegal();
                }
                next->status = JobStatus::FAILED;
                next->error = event.error;
                next->completed_at = now;
                break;
        }

        it->second.snapshot = next;
        published = next;
        if (next->isTerminal()) {
            released = std::move(it->second.asset);
        }
    }

    // Prepared audio is not needed once the job is terminal
    released.reset();

    switch (event.type) {
        case JobEvent::Type::START:
            utils::Logger::info("Job " + id + " started processing");
            break;
        case JobEvent::Type::PROGRESS:
            utils::Logger::debug("Job " + id + " progress " + std::to_string(published->progress) + "%");
            break;
        case JobEvent::Type::COMPLETE:
            utils::Logger::info("Job " + id + " completed (" +
                                std::to_string(published->result->segments.size()) + " segments)");
            break;
        case JobEvent::Type::FAIL:
            utils::Logger::warn("Job " + id + " failed: " + published->error->code + ": " +
                                published->error->message);
            break;
    }

    if (event.type != JobEvent::Type::PROGRESS) {
        persist(*published);
    }
    notifyTransition(published);
    return published;
}

JobSnapshot JobStore::get(const std::string& id) const {
    auto snapshot = find(id);
    if (!snapshot) {
        throw utils::JobNotFoundException(id);
    }
    return snapshot;
}

JobSnapshot JobStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    return it != jobs_.end() ? it->second.snapshot : nullptr;
}

void JobStore::remove(const std::string& id) {
    JobRecord removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            throw utils::JobNotFoundException(id);
        }
        if (!it->second.snapshot->isTerminal()) {
            throw utils::InvalidStateException(
                "Cannot delete a job in state '" + jobStatusToString(it->second.snapshot->status) + "'", id);
        }
        removed = std::move(it->second);
        jobs_.erase(it);
    }

    if (journal_) {
        journal_->erase(id);
    }
    // Normally already released by the terminal transition
    removed.asset.reset();
    utils::Logger::info("Deleted job " + id);
    notifyRemoved(*removed.snapshot);
}

void JobStore::attachAsset(const std::string& id, audio::AudioAssetPtr asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw utils::JobNotFoundException(id);
    }
    it->second.asset = std::move(asset);
}

audio::AudioAssetPtr JobStore::getAsset(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    return it != jobs_.end() ? it->second.asset : nullptr;
}

std::vector<JobSnapshot> JobStore::list(size_t limit) const {
    std::vector<JobSnapshot> snapshots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots.reserve(jobs_.size());
        for (const auto& entry : jobs_) {
            snapshots.push_back(entry.second.snapshot);
        }
    }

    std::sort(snapshots.begin(), snapshots.end(), [](const JobSnapshot& a, const JobSnapshot& b) {
        return a->created_at > b->created_at;
    });
    if (limit > 0 && snapshots.size() > limit) {
        snapshots.resize(limit);
    }
    return snapshots;
}

size_t JobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

size_t JobStore::countByStatus(JobStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(), [status](const auto& entry) {
        return entry.second.snapshot->status == status;
    }));
}

uint64_t JobStore::addTransitionCallback(JobTransitionCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    uint64_t callbackId = next_callback_id_++;
    transition_callbacks_[callbackId] = std::move(callback);
    return callbackId;
}

void JobStore::removeTransitionCallback(uint64_t callbackId) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    transition_callbacks_.erase(callbackId);
}

void JobStore::setRemovedCallback(JobRemovedCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    removed_callback_ = std::move(callback);
}

std::vector<std::string> JobStore::purgeExpired(std::chrono::seconds maxAge) {
    auto cutoff = std::chrono::system_clock::now() - maxAge;
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : jobs_) {
            const auto& job = *entry.second.snapshot;
            if (job.isTerminal() && job.completed_at && *job.completed_at < cutoff) {
                expired.push_back(entry.first);
            }
        }
    }

    std::vector<std::string> removed;
    for (const auto& id : expired) {
        try {
            remove(id);
            removed.push_back(id);
        } catch (const utils::JobNotFoundException&) {
            // deleted concurrently
        }
    }

    if (!removed.empty()) {
        utils::Logger::info("Purged " + std::to_string(removed.size()) + " expired jobs");
    }
    return removed;
}

std::vector<JobSnapshot> JobStore::findStuck(std::chrono::seconds threshold) const {
    auto cutoff = std::chrono::system_clock::now() - threshold;
    std::vector<JobSnapshot> stuck;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : jobs_) {
        const auto& job = entry.second.snapshot;
        if (job->status == JobStatus::PROCESSING && job->started_at && *job->started_at < cutoff) {
            stuck.push_back(job);
        }
    }
    return stuck;
}

std::vector<JobSnapshot> JobStore::recover() {
    std::vector<JobSnapshot> requeue;
    if (!journal_) {
        return requeue;
    }

    auto jobs = journal_->loadAll();
    size_t restored = 0;
    size_t interrupted = 0;

    for (auto& job : jobs) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (jobs_.count(job.id) > 0) {
                continue;
            }
        }

        auto now = std::chrono::system_clock::now();
        bool requeueable = false;

        if (job.status == JobStatus::PROCESSING) {
            job.status = JobStatus::FAILED;
            job.error = JobError{"INTERNAL_ERROR", "Job interrupted by service restart"};
            job.completed_at = now;
            ++interrupted;
        } else if (job.status == JobStatus::PENDING) {
            std::error_code ec;
            if (!job.source.stored_path.empty() && std::filesystem::exists(job.source.stored_path, ec)) {
                requeueable = true;
            } else {
                // Input is gone; record the job as having started and failed
                job.status = JobStatus::FAILED;
                job.started_at = now;
                job.completed_at = now;
                job.error = JobError{"AUDIO_PROCESSING_ERROR", "Input file no longer available after restart"};
                ++interrupted;
            }
        }

        auto snapshot = std::make_shared<const Job>(job);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_[job.id] = JobRecord{snapshot, nullptr};
        }
        persist(*snapshot);
        if (requeueable) {
            requeue.push_back(snapshot);
        }
        ++restored;
    }

    utils::Logger::info("Recovered " + std::to_string(restored) + " jobs from journal (" +
                        std::to_string(interrupted) + " interrupted, " +
                        std::to_string(requeue.size()) + " to re-queue)");
    return requeue;
}

void JobStore::persist(const Job& job) {
    if (journal_ && !journal_->record(job)) {
        utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
            utils::ErrorKind::INTERNAL, utils::ErrorSeverity::WARNING,
            "Failed to persist job record", job.id, "JobStore"));
    }
}

void JobStore::notifyTransition(const JobSnapshot& snapshot) {
    std::vector<JobTransitionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks.reserve(transition_callbacks_.size());
        for (const auto& entry : transition_callbacks_) {
            callbacks.push_back(entry.second);
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(snapshot);
        } catch (const std::exception& e) {
            utils::Logger::error("Error in job transition callback: " + std::string(e.what()));
        }
    }
}

void JobStore::notifyRemoved(const Job& job) {
    JobRemovedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = removed_callback_;
    }
    if (callback) {
        try {
            callback(job);
        } catch (const std::exception& e) {
            utils::Logger::error("Error in job removed callback: " + std::string(e.what()));
        }
    }
}

} // namespace core
} // namespace speechjobs
