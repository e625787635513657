#pragma once

#include "core/cancellation.hpp"
#include "core/job_store.hpp"
#include "core/transcription_coordinator.hpp"
#include "utils/config.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace speechjobs {
namespace core {

/**
 * Work executed for a job between its start and its terminal transition
 */
using JobPipeline = std::function<stt::TranscriptionResult(const JobSnapshot& job,
                                                           const CancellationToken& token,
                                                           const ProgressCallback& progress)>;

struct SchedulerConfig {
    size_t max_concurrent_jobs = 3;
    size_t max_queue_length = 0; // 0 = unbounded
    utils::MaintenanceSettings maintenance;

    static SchedulerConfig fromServiceConfig(const utils::ServiceConfig& config);
};

struct SchedulerStats {
    size_t queued = 0;
    size_t processing = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t canceled = 0;
};

/**
 * Bounded worker pool. A fixed number of workers pull job ids from one FIFO
 * queue; a queued job stays pending until a worker starts it. Every job a
 * worker starts ends in a complete or fail transition.
 */
class Scheduler {
public:
    /**
     * A claimed queue slot. Returned to the scheduler on destruction unless
     * consumed by submit().
     */
    class SlotReservation {
    public:
        SlotReservation() = default;
        ~SlotReservation() { release(); }

        SlotReservation(SlotReservation&& other) noexcept : scheduler_(other.scheduler_) {
            other.scheduler_ = nullptr;
        }
        SlotReservation& operator=(SlotReservation&& other) noexcept;

        SlotReservation(const SlotReservation&) = delete;
        SlotReservation& operator=(const SlotReservation&) = delete;

        explicit operator bool() const { return scheduler_ != nullptr; }

        void release();

    private:
        friend class Scheduler;
        explicit SlotReservation(Scheduler* scheduler) : scheduler_(scheduler) {}

        Scheduler* scheduler_ = nullptr;
    };

    Scheduler(std::shared_ptr<JobStore> store, JobPipeline pipeline, const SchedulerConfig& config);
    ~Scheduler();

    // Non-copyable, non-movable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    void start();

    /**
     * Stop accepting work, fail jobs still queued with CANCELED, cancel running
     * jobs and join the workers.
     */
    void stop();

    /**
     * Queue a pending job. Never blocks.
     * @return false if the scheduler is stopped, the queue is full, or the job
     *         is not pending or already queued
     */
    bool submit(const std::string& jobId);

    /**
     * Claim a queue slot ahead of creating the job that will fill it
     * @return an empty reservation if the scheduler is stopped or the queue is full
     */
    SlotReservation reserve();

    /**
     * Queue a pending job into a slot claimed by reserve(). The reservation is
     * consumed on success.
     * @return false if the scheduler stopped after the slot was claimed
     */
    bool submit(const std::string& jobId, SlotReservation& reservation);

    /**
     * Request cooperative cancellation of a queued or running job
     * @return false if the job is neither queued nor running
     */
    bool cancel(const std::string& jobId);

    /**
     * Whether submit() would currently accept a job. Outstanding reservations
     * count against the queue limit.
     */
    bool canAccept() const;

    bool isRunning() const { return running_; }
    size_t getQueueLength() const;
    size_t getActiveJobs() const { return active_jobs_; }
    size_t getWorkerCount() const { return config_.max_concurrent_jobs; }
    SchedulerStats getStats() const;

    /**
     * Purge expired terminal jobs and warn about long-running ones. Called
     * periodically by the maintenance thread.
     */
    void runMaintenance();

    static constexpr const char* kShutdownReason = "Service shutting down";

private:
    void workerLoop();
    void maintenanceLoop();
    void execute(const std::string& jobId, const CancellationTokenPtr& token);
    void failJob(const std::string& jobId, const std::string& code, const std::string& message);
    bool enqueueLocked(const std::string& jobId);
    bool hasCapacityLocked() const;

    std::shared_ptr<JobStore> store_;
    JobPipeline pipeline_;
    SchedulerConfig config_;

    std::deque<std::string> queue_;
    std::unordered_map<std::string, CancellationTokenPtr> tokens_; // queued and running jobs
    size_t reserved_slots_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable condition_;

    std::vector<std::thread> workers_;
    std::thread maintenance_thread_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_condition_;

    std::atomic<bool> running_;
    std::atomic<bool> stopping_;
    std::atomic<size_t> active_jobs_;
    std::atomic<size_t> completed_jobs_;
    std::atomic<size_t> failed_jobs_;
    std::atomic<size_t> canceled_jobs_;
};

} // namespace core
} // namespace speechjobs
