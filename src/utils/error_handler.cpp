#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace speechjobs {
namespace utils {

ErrorInfo::ErrorInfo(ErrorKind k, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, bool is_transient)
    : kind(k), severity(sev), message(msg), details(det), context(ctx),
      transient(is_transient), timestamp(std::chrono::steady_clock::now()) {

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

SpeechJobsException::SpeechJobsException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* SpeechJobsException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

ValidationException::ValidationException(const std::string& message, const std::string& details)
    : SpeechJobsException(ErrorInfo(ErrorKind::VALIDATION, ErrorSeverity::WARNING,
                                     message, details, "Validation")) {
}

AudioProcessingException::AudioProcessingException(const std::string& message, const std::string& details)
    : SpeechJobsException(ErrorInfo(ErrorKind::AUDIO_PROCESSING, ErrorSeverity::ERROR,
                                     message, details, "AudioProcessing")) {
}

ModelLoadException::ModelLoadException(const std::string& message, const std::string& model)
    : SpeechJobsException(ErrorInfo(ErrorKind::MODEL_LOAD, ErrorSeverity::CRITICAL,
                                     message, model, "ModelLoading")) {
}

TranscriptionException::TranscriptionException(const std::string& message, const std::string& details,
                                               bool transient)
    : SpeechJobsException(ErrorInfo(ErrorKind::TRANSCRIPTION, ErrorSeverity::ERROR,
                                     message, details, "Transcription", transient)) {
}

DiarizationException::DiarizationException(const std::string& message, const std::string& details,
                                           bool transient)
    : SpeechJobsException(ErrorInfo(ErrorKind::DIARIZATION, ErrorSeverity::ERROR,
                                     message, details, "Diarization", transient)) {
}

TranslationException::TranslationException(const std::string& message, const std::string& details,
                                           bool transient)
    : SpeechJobsException(ErrorInfo(ErrorKind::TRANSLATION, ErrorSeverity::ERROR,
                                     message, details, "Translation", transient)) {
}

CanceledException::CanceledException(const std::string& message)
    : SpeechJobsException(ErrorInfo(ErrorKind::CANCELED, ErrorSeverity::INFO,
                                     message, "", "Cancellation")) {
}

InternalException::InternalException(const std::string& message, const std::string& details)
    : SpeechJobsException(ErrorInfo(ErrorKind::INTERNAL, ErrorSeverity::CRITICAL,
                                     message, details, "Internal")) {
}

InvalidStateException::InvalidStateException(const std::string& message, const std::string& job_id)
    : SpeechJobsException(ErrorInfo(ErrorKind::INVALID_STATE, ErrorSeverity::WARNING,
                                     message, job_id, "JobStore")) {
}

JobNotFoundException::JobNotFoundException(const std::string& job_id)
    : SpeechJobsException(ErrorInfo(ErrorKind::JOB_NOT_FOUND, ErrorSeverity::WARNING,
                                     "Job " + job_id + " not found",
                                     "No job exists with ID: " + job_id, "JobStore")) {
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        error_counts_[error.kind]++;
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context) {
    ErrorInfo info = error_utils::classify(e);
    if (!context.empty()) {
        info.context = context;
    }
    reportError(info);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(kind);
    return it != error_counts_.end() ? it->second : 0;
}

size_t ErrorHandler::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : error_counts_) {
        total += entry.second;
    }
    return total;
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = error_history_.size() > count ? error_history_.size() - count : 0;
    return std::vector<ErrorInfo>(error_history_.begin() + start, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
    error_counts_.clear();
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::ostringstream ss;
    ss << "[" << error.id << "] " << error_utils::errorKindToCode(error.kind);
    if (!error.context.empty()) {
        ss << " (" << error.context << ")";
    }
    ss << ": " << error.message;
    if (!error.details.empty()) {
        ss << " - " << error.details;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(ss.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(ss.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(ss.str());
            break;
    }
}

namespace error_utils {

std::string errorKindToCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "VALIDATION_ERROR";
        case ErrorKind::AUDIO_PROCESSING: return "AUDIO_PROCESSING_ERROR";
        case ErrorKind::MODEL_LOAD: return "MODEL_LOAD_ERROR";
        case ErrorKind::TRANSCRIPTION: return "TRANSCRIPTION_ERROR";
        case ErrorKind::DIARIZATION: return "DIARIZATION_ERROR";
        case ErrorKind::TRANSLATION: return "TRANSLATION_ERROR";
        case ErrorKind::CANCELED: return "CANCELED";
        case ErrorKind::INTERNAL: return "INTERNAL_ERROR";
        case ErrorKind::INVALID_STATE: return "INVALID_STATE";
        case ErrorKind::JOB_NOT_FOUND: return "JOB_NOT_FOUND";
    }
    return "INTERNAL_ERROR";
}

ErrorInfo classify(const std::exception& e) {
    if (auto* known = dynamic_cast<const SpeechJobsException*>(&e)) {
        return known->getErrorInfo();
    }
    return ErrorInfo(ErrorKind::INTERNAL, ErrorSeverity::CRITICAL,
                     "Unexpected internal error", e.what(), "Internal");
}

void throwError(const ErrorInfo& error) {
    switch (error.kind) {
        case ErrorKind::VALIDATION: throw ValidationException(error);
        case ErrorKind::AUDIO_PROCESSING: throw AudioProcessingException(error);
        case ErrorKind::MODEL_LOAD: throw ModelLoadException(error);
        case ErrorKind::TRANSCRIPTION: throw TranscriptionException(error);
        case ErrorKind::DIARIZATION: throw DiarizationException(error);
        case ErrorKind::TRANSLATION: throw TranslationException(error);
        case ErrorKind::CANCELED: throw CanceledException(error);
        case ErrorKind::INTERNAL: throw InternalException(error);
        case ErrorKind::INVALID_STATE: throw InvalidStateException(error);
        case ErrorKind::JOB_NOT_FOUND: throw JobNotFoundException(error);
    }
    throw SpeechJobsException(error);
}

} // namespace error_utils

} // namespace utils
} // namespace speechjobs
