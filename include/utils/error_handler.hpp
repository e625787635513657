#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace speechjobs {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error kinds exposed to callers. Every failure that leaves the service is
 * mapped onto one of these.
 */
enum class ErrorKind {
    VALIDATION,
    AUDIO_PROCESSING,
    MODEL_LOAD,
    TRANSCRIPTION,
    DIARIZATION,
    TRANSLATION,
    CANCELED,
    INTERNAL,
    INVALID_STATE,
    JOB_NOT_FOUND
};

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorKind kind;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    bool transient;
    std::chrono::steady_clock::time_point timestamp;

    ErrorInfo(ErrorKind k, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              bool is_transient = false);
};

/**
 * Base exception carrying an ErrorInfo
 */
class SpeechJobsException : public std::exception {
public:
    explicit SpeechJobsException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }
    ErrorKind kind() const { return error_info_.kind; }
    bool isTransient() const { return error_info_.transient; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class ValidationException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    ValidationException(const std::string& message, const std::string& details = "");
};

class AudioProcessingException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    AudioProcessingException(const std::string& message, const std::string& details = "");
};

class ModelLoadException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    ModelLoadException(const std::string& message, const std::string& model = "");
};

/**
 * Raised by recognition capabilities. Transient by default: the coordinator
 * retries transient failures once.
 */
class TranscriptionException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    TranscriptionException(const std::string& message, const std::string& details = "",
                           bool transient = true);
};

class DiarizationException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    DiarizationException(const std::string& message, const std::string& details = "",
                         bool transient = true);
};

class TranslationException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    TranslationException(const std::string& message, const std::string& details = "",
                         bool transient = true);
};

class CanceledException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    explicit CanceledException(const std::string& message = "Job was canceled");
};

class InternalException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    InternalException(const std::string& message, const std::string& details = "");
};

class InvalidStateException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    InvalidStateException(const std::string& message, const std::string& job_id = "");
};

class JobNotFoundException : public SpeechJobsException {
public:
    using SpeechJobsException::SpeechJobsException;
    explicit JobNotFoundException(const std::string& job_id);
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error sink for the service
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "");

    void setErrorCallback(ErrorCallback callback);

    /**
     * Number of reported errors of the given kind
     */
    size_t getErrorCount(ErrorKind kind) const;
    size_t getTotalErrorCount() const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    std::map<ErrorKind, size_t> error_counts_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

namespace error_utils {

/**
 * Stable error code exposed through job status, e.g. "TRANSCRIPTION_ERROR"
 */
std::string errorKindToCode(ErrorKind kind);

/**
 * Map an arbitrary exception onto an ErrorInfo. Exceptions outside the
 * SpeechJobsException hierarchy become INTERNAL errors.
 */
ErrorInfo classify(const std::exception& e);

/**
 * Throw the exception type matching error.kind, carrying the ErrorInfo as is
 */
[[noreturn]] void throwError(const ErrorInfo& error);

} // namespace error_utils

} // namespace utils
} // namespace speechjobs
