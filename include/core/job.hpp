#pragma once

#include "stt/transcript.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace speechjobs {
namespace core {

/**
 * Job lifecycle: pending -> processing -> {completed | failed}
 */
enum class JobStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED
};

std::string jobStatusToString(JobStatus status);

/**
 * @throws ValidationException for unknown names
 */
JobStatus jobStatusFromString(const std::string& name);

inline bool isTerminal(JobStatus status) {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED;
}

enum class ModelSize {
    TINY,
    BASE,
    SMALL,
    MEDIUM,
    LARGE
};

std::string modelSizeToString(ModelSize size);
std::optional<ModelSize> parseModelSize(const std::string& name);

struct JobOptions {
    std::optional<std::string> language;
    ModelSize model_size = ModelSize::BASE;
    bool enable_diarization = false;
    std::optional<int> num_speakers;
};

/**
 * User-visible failure: stable code plus human-readable message
 */
struct JobError {
    std::string code;
    std::string message;
};

/**
 * Where a job's input lives. Recorded so pending jobs can be re-queued
 * after a restart.
 */
struct JobSource {
    std::string file_name;   // name declared by the client
    std::string stored_path; // copy under upload_dir
};

/**
 * Immutable job snapshot. The store replaces snapshots, never mutates them.
 */
struct Job {
    std::string id;
    JobStatus status = JobStatus::PENDING;
    int progress = 0;
    JobOptions options;
    JobSource source;
    std::optional<stt::TranscriptionResult> result;
    std::optional<JobError> error;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;

    bool isTerminal() const { return core::isTerminal(status); }

    /**
     * Wall time between start and completion, if both happened
     */
    std::optional<double> processingSeconds() const;
};

using JobSnapshot = std::shared_ptr<const Job>;

/**
 * State machine input
 */
struct JobEvent {
    enum class Type {
        START,
        PROGRESS,
        COMPLETE,
        FAIL
    };

    Type type = Type::START;
    int progress = 0;
    stt::TranscriptionResult result;
    JobError error;

    static JobEvent start();
    static JobEvent progressTo(int value);
    static JobEvent complete(stt::TranscriptionResult result);
    static JobEvent fail(JobError error);
    static JobEvent fail(const std::string& code, const std::string& message);
};

std::string jobEventTypeToString(JobEvent::Type type);

} // namespace core
} // namespace speechjobs
