#pragma once

#include "audio/audio_preprocessor.hpp"
#include "core/job.hpp"
#include "core/job_journal.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace speechjobs {
namespace core {

/**
 * Callback types for job changes
 */
using JobTransitionCallback = std::function<void(const JobSnapshot&)>;
using JobRemovedCallback = std::function<void(const Job&)>;

/**
 * Owns job records and enforces the lifecycle state machine.
 *
 * Every accepted transition publishes a new immutable snapshot under a short
 * lock; readers get a shared_ptr to a complete snapshot and never observe a
 * partially updated job. Transition callbacks run on the writer's thread,
 * outside the store lock, in transition order for a given job.
 */
class JobStore {
public:
    explicit JobStore(std::shared_ptr<JobJournal> journal = nullptr);
    ~JobStore() = default;

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /**
     * Create a pending job with progress 0
     * @return New job id
     */
    std::string create(const JobOptions& options, const JobSource& source = JobSource());

    /**
     * Apply an event. Legal edges are start (pending -> processing),
     * progress (processing), complete and fail (processing -> terminal).
     * A progress value below the current one is ignored; values above 100
     * are clamped.
     * @return Snapshot after the event
     * @throws JobNotFoundException for unknown ids
     * @throws InvalidStateException for illegal edges
     */
    JobSnapshot transition(const std::string& id, const JobEvent& event);

    /**
     * @throws JobNotFoundException for unknown ids
     */
    JobSnapshot get(const std::string& id) const;

    /**
     * @return Snapshot, or nullptr for unknown ids
     */
    JobSnapshot find(const std::string& id) const;

    /**
     * Delete a terminal job and release its audio asset
     * @throws JobNotFoundException for unknown ids
     * @throws InvalidStateException if the job is not terminal
     */
    void remove(const std::string& id);

    /**
     * Attach the prepared audio; the store keeps it until the job is terminal
     */
    void attachAsset(const std::string& id, audio::AudioAssetPtr asset);
    audio::AudioAssetPtr getAsset(const std::string& id) const;

    /**
     * Snapshots ordered newest first
     * @param limit 0 for all
     */
    std::vector<JobSnapshot> list(size_t limit = 0) const;

    size_t size() const;
    size_t countByStatus(JobStatus status) const;

    // Callbacks
    uint64_t addTransitionCallback(JobTransitionCallback callback);
    void removeTransitionCallback(uint64_t callbackId);
    void setRemovedCallback(JobRemovedCallback callback);

    /**
     * Remove terminal jobs that completed more than maxAge ago
     * @return Ids of removed jobs
     */
    std::vector<std::string> purgeExpired(std::chrono::seconds maxAge);

    /**
     * Jobs processing for longer than threshold
     */
    std::vector<JobSnapshot> findStuck(std::chrono::seconds threshold) const;

    /**
     * Reload jobs from the journal. Jobs interrupted while processing are
     * failed; pending jobs whose stored input still exists are returned so
     * they can be queued again, other pending jobs are failed.
     * @return Pending jobs to re-queue
     */
    std::vector<JobSnapshot> recover();

private:
    struct JobRecord {
        JobSnapshot snapshot;
        audio::AudioAssetPtr asset;
    };

    static std::string generateJobId();
    void persist(const Job& job);
    void notifyTransition(const JobSnapshot& snapshot);
    void notifyRemoved(const Job& job);

    std::unordered_map<std::string, JobRecord> jobs_;
    mutable std::mutex mutex_;

    std::map<uint64_t, JobTransitionCallback> transition_callbacks_;
    JobRemovedCallback removed_callback_;
    uint64_t next_callback_id_ = 1;
    mutable std::mutex callbacks_mutex_;

    std::shared_ptr<JobJournal> journal_;
};

} // namespace core
} // namespace speechjobs
