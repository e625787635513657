#include "core/progress_reporter.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <vector>

namespace speechjobs {
namespace core {

ProgressReporter::ProgressReporter(std::shared_ptr<JobStore> store)
    : store_(std::move(store)) {
    store_callback_id_ = store_->addTransitionCallback([this](const JobSnapshot& snapshot) {
        onTransition(snapshot);
    });
}

ProgressReporter::~ProgressReporter() {
    store_->removeTransitionCallback(store_callback_id_);
}

JobSnapshot ProgressReporter::status(const std::string& jobId) const {
    return store_->get(jobId);
}

SubscriptionId ProgressReporter::subscribe(const std::string& jobId, JobUpdateCallback callback) {
    SubscriptionId subscriptionId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptionId = next_subscription_id_++;
        subscriptions_[subscriptionId] = Subscription{jobId, callback};
    }

    // Read after registering so a terminal transition racing with this call
    // is seen either here or by onTransition.
    auto snapshot = store_->find(jobId);
    if (!snapshot) {
        unsubscribe(subscriptionId);
        throw utils::JobNotFoundException(jobId);
    }

    if (snapshot->isTerminal()) {
        bool stillRegistered;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stillRegistered = subscriptions_.erase(subscriptionId) > 0;
        }
        if (stillRegistered) {
            deliver(callback, snapshot);
        }
    }
    return subscriptionId;
}

void ProgressReporter::unsubscribe(SubscriptionId subscriptionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(subscriptionId);
}

JobSnapshot ProgressReporter::waitForTerminal(const std::string& jobId,
                                              std::chrono::milliseconds timeout) const {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        terminal_condition_.wait_for(lock, timeout, [&]() {
            auto snapshot = store_->find(jobId);
            return !snapshot || snapshot->isTerminal();
        });
    }
    return store_->get(jobId);
}

size_t ProgressReporter::getSubscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void ProgressReporter::onTransition(const JobSnapshot& snapshot) {
    std::vector<JobUpdateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
            if (it->second.job_id != snapshot->id) {
                ++it;
                continue;
            }
            callbacks.push_back(it->second.callback);
            if (snapshot->isTerminal()) {
                it = subscriptions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& callback : callbacks) {
        deliver(callback, snapshot);
    }

    if (snapshot->isTerminal()) {
        std::lock_guard<std::mutex> lock(mutex_);
        terminal_condition_.notify_all();
    }
}

void ProgressReporter::deliver(const JobUpdateCallback& callback, const JobSnapshot& snapshot) {
    try {
        callback(snapshot);
    } catch (const std::exception& e) {
        utils::Logger::error("Error in progress subscriber for job " + snapshot->id + ": " + e.what());
    }
}

} // namespace core
} // namespace speechjobs
