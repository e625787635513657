#pragma once

#include "core/cancellation.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace speechjobs {
namespace core {

/**
 * Outcome of one capability call site: Ok(value), Degraded(value, warning)
 * or Fatal(error). The call site decides whether Fatal propagates.
 */
template<typename T>
class CallOutcome {
public:
    enum class Kind {
        OK,
        DEGRADED,
        FATAL
    };

    static CallOutcome ok(T value) {
        return CallOutcome(Kind::OK, std::move(value), std::string(), std::nullopt);
    }

    static CallOutcome degraded(T value, std::string warning) {
        return CallOutcome(Kind::DEGRADED, std::move(value), std::move(warning), std::nullopt);
    }

    static CallOutcome fatal(utils::ErrorInfo error) {
        return CallOutcome(Kind::FATAL, std::nullopt, std::string(), std::move(error));
    }

    Kind kind() const { return kind_; }
    bool isOk() const { return kind_ == Kind::OK; }
    bool isDegraded() const { return kind_ == Kind::DEGRADED; }
    bool isFatal() const { return kind_ == Kind::FATAL; }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    const std::string& warning() const { return warning_; }
    const utils::ErrorInfo& error() const { return *error_; }

private:
    CallOutcome(Kind kind, std::optional<T> value, std::string warning,
                std::optional<utils::ErrorInfo> error)
        : kind_(kind), value_(std::move(value)), warning_(std::move(warning)), error_(std::move(error)) {}

    Kind kind_;
    std::optional<T> value_;
    std::string warning_;
    std::optional<utils::ErrorInfo> error_;
};

/**
 * Run a capability call, retrying transient SpeechJobsExceptions up to
 * retry.max_attempts attempts with retry.backoff_ms between them.
 *
 * Cancellation is checked before every attempt and CanceledException always
 * propagates. Non-transient errors (ModelLoadException among them) are not
 * retried. Exceptions outside the SpeechJobsException hierarchy propagate
 * unchanged so the worker reports them as internal errors.
 */
template<typename Fn>
auto invokeWithRetry(Fn&& fn, const utils::RetrySettings& retry, const CancellationToken& token,
                     const std::string& label) -> CallOutcome<decltype(fn())> {
    using Result = decltype(fn());

    int maxAttempts = retry.max_attempts < 1 ? 1 : retry.max_attempts;
    for (int attempt = 1;; ++attempt) {
        token.throwIfCancelled();
        try {
            return CallOutcome<Result>::ok(fn());
        } catch (const utils::CanceledException&) {
            throw;
        } catch (const utils::SpeechJobsException& e) {
            if (!e.isTransient() || attempt >= maxAttempts) {
                utils::Logger::warn(label + " failed after " + std::to_string(attempt) +
                                    " attempt(s): " + e.what());
                return CallOutcome<Result>::fatal(e.getErrorInfo());
            }
            utils::Logger::warn(label + " attempt " + std::to_string(attempt) +
                                " failed, retrying: " + e.what());
        }

        if (retry.backoff_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(retry.backoff_ms));
        }
    }
}

} // namespace core
} // namespace speechjobs
