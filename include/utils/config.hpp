#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace speechjobs {
namespace utils {

struct WhisperSettings {
    std::string models_path = "models/";
    std::string model_size = "base";
    std::string device = "cpu";
    int threads = 4;
};

struct AudioSettings {
    double chunk_threshold_seconds = 600.0;
    double chunk_duration_seconds = 30.0;
    bool retain_processed_audio = false;
};

struct DiarizationSettings {
    double dominance_threshold = 0.8;
    std::string split_strategy = "word_boundary";
    double min_split_duration = 0.2;
};

struct CapabilitySettings {
    bool serialize_transcriber = true;
    bool serialize_diarizer = true;
    bool serialize_translator = true;
};

struct RetrySettings {
    int max_attempts = 2;
    int backoff_ms = 100;
};

struct MaintenanceSettings {
    int interval_seconds = 60;
    int retention_hours = 24;
    int stuck_job_warning_seconds = 3600;
};

/**
 * Service-wide configuration
 */
struct ServiceConfig {
    size_t max_concurrent_jobs = 3;
    size_t max_queue_length = 0; // 0 = unbounded
    size_t max_upload_size_mb = 500;

    std::string upload_dir = "./storage/uploads";
    std::string processed_dir = "./storage/processed";
    std::string journal_dir;     // empty disables the job journal
    std::string log_level = "info";

    WhisperSettings whisper;
    AudioSettings audio;
    DiarizationSettings diarization;
    CapabilitySettings capabilities;
    RetrySettings retry;
    MaintenanceSettings maintenance;
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    /**
     * Load configuration from a JSON file, then apply SPEECHJOBS_* environment
     * overrides. A missing file yields defaults plus overrides.
     * @throws ValidationException if the file exists but cannot be parsed
     */
    static ServiceConfig load(const std::string& configPath);

    /**
     * Parse configuration from a JSON document
     */
    static ServiceConfig fromJson(const std::string& json);

    /**
     * Apply SPEECHJOBS_* environment variables on top of a configuration
     */
    static void applyEnvironment(ServiceConfig& config);

    static ConfigValidationResult validate(const ServiceConfig& config);
};

} // namespace utils
} // namespace speechjobs
