#pragma once

#include "core/job_store.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace speechjobs {
namespace core {

using SubscriptionId = uint64_t;
using JobUpdateCallback = std::function<void(const JobSnapshot&)>;

/**
 * Read-only view of job state for pollers and subscribers.
 *
 * status() reads the published snapshot and never waits on a worker.
 * Subscribers receive one snapshot per transition of their job; the terminal
 * snapshot is delivered at least once, including to subscribers that
 * register after the job has already finished. Subscriptions end
 * automatically after the terminal snapshot.
 */
class ProgressReporter {
public:
    explicit ProgressReporter(std::shared_ptr<JobStore> store);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    /**
     * @throws JobNotFoundException for unknown ids
     */
    JobSnapshot status(const std::string& jobId) const;

    /**
     * @throws JobNotFoundException for unknown ids
     */
    SubscriptionId subscribe(const std::string& jobId, JobUpdateCallback callback);
    void unsubscribe(SubscriptionId subscriptionId);

    /**
     * Block until the job is terminal or the timeout expires
     * @return Latest snapshot
     * @throws JobNotFoundException for unknown ids
     */
    JobSnapshot waitForTerminal(const std::string& jobId, std::chrono::milliseconds timeout) const;

    size_t getSubscriptionCount() const;

private:
    struct Subscription {
        std::string job_id;
        JobUpdateCallback callback;
    };

    void onTransition(const JobSnapshot& snapshot);
    static void deliver(const JobUpdateCallback& callback, const JobSnapshot& snapshot);

    std::shared_ptr<JobStore> store_;
    uint64_t store_callback_id_;

    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_subscription_id_ = 1;
    mutable std::mutex mutex_;
    mutable std::condition_variable terminal_condition_;
};

} // namespace core
} // namespace speechjobs
