#pragma once

#include "utils/error_handler.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace speechjobs {
namespace core {

/**
 * Cooperative cancellation flag shared between the scheduler and the
 * pipeline executing a job. Checked between suspension points only.
 */
class CancellationToken {
public:
    void cancel(const std::string& reason = "Job was canceled") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            return;
        }
        reason_ = reason;
        cancelled_.store(true);
    }

    bool isCancelled() const {
        return cancelled_.load();
    }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    /**
     * @throws CanceledException if cancellation was requested
     */
    void throwIfCancelled() const {
        if (isCancelled()) {
            throw utils::CanceledException(reason());
        }
    }

private:
    std::atomic<bool> cancelled_{false};
    std::string reason_;
    mutable std::mutex mutex_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace core
} // namespace speechjobs
