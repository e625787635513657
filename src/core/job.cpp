#include "core/job.hpp"
#include "utils/error_handler.hpp"

namespace speechjobs {
namespace core {

std::string jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::PROCESSING: return "processing";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED: return "failed";
    }
    return "unknown";
}

JobStatus jobStatusFromString(const std::string& name) {
    if (name == "pending") return JobStatus::PENDING;
    if (name == "processing") return JobStatus::PROCESSING;
    if (name == "completed") return JobStatus::COMPLETED;
    if (name == "failed") return JobStatus::FAILED;
    throw utils::ValidationException("Unknown job status", name);
}

std::string modelSizeToString(ModelSize size) {
    switch (size) {
        case ModelSize::TINY: return "tiny";
        case ModelSize::BASE: return "base";
        case ModelSize::SMALL: return "small";
        case ModelSize::MEDIUM: return "medium";
        case ModelSize::LARGE: return "large";
    }
    return "base";
}

std::optional<ModelSize> parseModelSize(const std::string& name) {
    if (name == "tiny") return ModelSize::TINY;
    if (name == "base") return ModelSize::BASE;
    if (name == "small") return ModelSize::SMALL;
    if (name == "medium") return ModelSize::MEDIUM;
    if (name == "large") return ModelSize::LARGE;
    return std::nullopt;
}

std::optional<double> Job::processingSeconds() const {
    if (!started_at || !completed_at) {
        return std::nullopt;
    }
    return std::chrono::duration<double>(*completed_at - *started_at).count();
}

JobEvent JobEvent::start() {
    JobEvent event;
    event.type = Type::START;
    return event;
}

JobEvent JobEvent::progressTo(int value) {
    JobEvent event;
    event.type = Type::PROGRESS;
    event.progress = value;
    return event;
}

JobEvent JobEvent::complete(stt::TranscriptionResult result) {
    JobEvent event;
    event.type = Type::COMPLETE;
    event.result = std::move(result);
    return event;
}

JobEvent JobEvent::fail(JobError error) {
    JobEvent event;
    event.type = Type::FAIL;
    event.error = std::move(error);
    return event;
}

JobEvent JobEvent::fail(const std::string& code, const std::string& message) {
    return fail(JobError{code, message});
}

std::string jobEventTypeToString(JobEvent::Type type) {
    switch (type) {
        case JobEvent::Type::START: return "start";
        case JobEvent::Type::PROGRESS: return "progress";
        case JobEvent::Type::COMPLETE: return "complete";
        case JobEvent::Type::FAIL: return "fail";
    }
    return "unknown";
}

} // namespace core
} // namespace speechjobs
