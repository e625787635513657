#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace speechjobs {
namespace utils {

using json = nlohmann::json;

namespace {

template<typename T>
void readValue(const json& node, const char* key, T& target) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes" || value == "on";
}

ServiceConfig parseDocument(const json& root) {
    ServiceConfig config;

    readValue(root, "max_concurrent_jobs", config.max_concurrent_jobs);
    readValue(root, "max_queue_length", config.max_queue_length);
    readValue(root, "max_upload_size_mb", config.max_upload_size_mb);
    readValue(root, "upload_dir", config.upload_dir);
    readValue(root, "processed_dir", config.processed_dir);
    readValue(root, "journal_dir", config.journal_dir);
    readValue(root, "log_level", config.log_level);

    if (root.contains("whisper")) {
        const auto& node = root.at("whisper");
        readValue(node, "models_path", config.whisper.models_path);
        readValue(node, "model_size", config.whisper.model_size);
        readValue(node, "device", config.whisper.device);
        readValue(node, "threads", config.whisper.threads);
    }

    if (root.contains("audio")) {
        const auto& node = root.at("audio");
        readValue(node, "chunk_threshold_seconds", config.audio.chunk_threshold_seconds);
        readValue(node, "chunk_duration_seconds", config.audio.chunk_duration_seconds);
        readValue(node, "retain_processed_audio", config.audio.retain_processed_audio);
    }

    if (root.contains("diarization")) {
        const auto& node = root.at("diarization");
        readValue(node, "dominance_threshold", config.diarization.dominance_threshold);
        readValue(node, "split_strategy", config.diarization.split_strategy);
        readValue(node, "min_split_duration", config.diarization.min_split_duration);
    }

    if (root.contains("capabilities")) {
        const auto& node = root.at("capabilities");
        readValue(node, "serialize_transcriber", config.capabilities.serialize_transcriber);
        readValue(node, "serialize_diarizer", config.capabilities.serialize_diarizer);
        readValue(node, "serialize_translator", config.capabilities.serialize_translator);
    }

    if (root.contains("retry")) {
        const auto& node = root.at("retry");
        readValue(node, "max_attempts", config.retry.max_attempts);
        readValue(node, "backoff_ms", config.retry.backoff_ms);
    }

    if (root.contains("maintenance")) {
        const auto& node = root.at("maintenance");
        readValue(node, "interval_seconds", config.maintenance.interval_seconds);
        readValue(node, "retention_hours", config.maintenance.retention_hours);
        readValue(node, "stuck_job_warning_seconds", config.maintenance.stuck_job_warning_seconds);
    }

    return config;
}

} // namespace

ServiceConfig ConfigLoader::load(const std::string& configPath) {
    ServiceConfig config;

    std::ifstream file(configPath);
    if (file.is_open()) {
        std::stringstream buffer;
        buffer << file.rdbuf();
        config = fromJson(buffer.str());
        Logger::info("Loaded configuration from " + configPath);
    } else {
        Logger::info("Configuration file " + configPath + " not found, using defaults");
    }

    applyEnvironment(config);
    return config;
}

ServiceConfig ConfigLoader::fromJson(const std::string& text) {
    try {
        return parseDocument(json::parse(text));
    } catch (const json::exception& e) {
        throw ValidationException("Invalid configuration", e.what());
    }
}

void ConfigLoader::applyEnvironment(ServiceConfig& config) {
    try {
        if (auto v = env("SPEECHJOBS_MAX_CONCURRENT_JOBS")) config.max_concurrent_jobs = std::stoul(v);
        if (auto v = env("SPEECHJOBS_MAX_QUEUE_LENGTH")) config.max_queue_length = std::stoul(v);
        if (auto v = env("SPEECHJOBS_MAX_UPLOAD_SIZE_MB")) config.max_upload_size_mb = std::stoul(v);
        if (auto v = env("SPEECHJOBS_UPLOAD_DIR")) config.upload_dir = v;
        if (auto v = env("SPEECHJOBS_PROCESSED_DIR")) config.processed_dir = v;
        if (auto v = env("SPEECHJOBS_JOURNAL_DIR")) config.journal_dir = v;
        if (auto v = env("SPEECHJOBS_LOG_LEVEL")) config.log_level = v;
        if (auto v = env("SPEECHJOBS_MODELS_PATH")) config.whisper.models_path = v;
        if (auto v = env("SPEECHJOBS_MODEL_SIZE")) config.whisper.model_size = v;
        if (auto v = env("SPEECHJOBS_DEVICE")) config.whisper.device = v;
        if (auto v = env("SPEECHJOBS_THREADS")) config.whisper.threads = std::stoi(v);
        if (auto v = env("SPEECHJOBS_RETAIN_PROCESSED_AUDIO")) config.audio.retain_processed_audio = parseBool(v);
        if (auto v = env("SPEECHJOBS_DOMINANCE_THRESHOLD")) config.diarization.dominance_threshold = std::stod(v);
        if (auto v = env("SPEECHJOBS_SPLIT_STRATEGY")) config.diarization.split_strategy = v;
    } catch (const std::exception& e) {
        throw ValidationException("Invalid environment override", e.what());
    }
}

ConfigValidationResult ConfigLoader::validate(const ServiceConfig& config) {
    ConfigValidationResult result;

    if (config.max_concurrent_jobs == 0) {
        result.addError("max_concurrent_jobs must be at least 1");
    }
    if (config.max_upload_size_mb == 0) {
        result.addError("max_upload_size_mb must be at least 1");
    }
    if (config.upload_dir.empty() || config.processed_dir.empty()) {
        result.addError("upload_dir and processed_dir must be set");
    }
    if (config.audio.chunk_duration_seconds < 1.0) {
        result.addError("audio.chunk_duration_seconds must be at least 1 second");
    }
    if (config.audio.chunk_threshold_seconds < config.audio.chunk_duration_seconds) {
        result.addWarning("audio.chunk_threshold_seconds is below chunk_duration_seconds; "
                          "long inputs will produce a single oversized chunk");
    }
    if (config.diarization.dominance_threshold <= 0.5 || config.diarization.dominance_threshold > 1.0) {
        result.addError("diarization.dominance_threshold must be in (0.5, 1.0]");
    }
    if (config.diarization.split_strategy != "word_boundary" &&
        config.diarization.split_strategy != "midpoint") {
        result.addError("diarization.split_strategy must be 'word_boundary' or 'midpoint'");
    }
    if (config.diarization.min_split_duration < 0.0) {
        result.addError("diarization.min_split_duration must not be negative");
    }
    if (config.retry.max_attempts < 1) {
        result.addError("retry.max_attempts must be at least 1");
    }
    if (config.retry.backoff_ms < 0) {
        result.addError("retry.backoff_ms must not be negative");
    }
    if (config.whisper.threads < 1) {
        result.addWarning("whisper.threads below 1, falling back to 1");
    }
    if (config.maintenance.interval_seconds < 1) {
        result.addError("maintenance.interval_seconds must be at least 1");
    }
    if (config.journal_dir.empty()) {
        result.addWarning("journal_dir is empty; jobs will not survive a restart");
    }

    return result;
}

} // namespace utils
} // namespace speechjobs
