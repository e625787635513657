#include "core/job_json.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"

namespace speechjobs {

using nlohmann::json;

namespace stt {

void to_json(json& j, const Word& word) {
    j = json{
        {"word", word.text},
        {"start", word.start},
        {"end", word.end},
        {"confidence", word.confidence}
    };
}

void from_json(const json& j, Word& word) {
    j.at("word").get_to(word.text);
    j.at("start").get_to(word.start);
    j.at("end").get_to(word.end);
    word.confidence = j.value("confidence", 0.0f);
}

void to_json(json& j, const TranscriptSegment& segment) {
    j = json{
        {"id", segment.id},
        {"text", segment.text},
        {"start", segment.start},
        {"end", segment.end},
        {"confidence", segment.confidence},
        {"speaker", segment.speaker ? json(*segment.speaker) : json(nullptr)}
    };
    if (!segment.words.empty()) {
        j["words"] = segment.words;
    }
}

void from_json(const json& j, TranscriptSegment& segment) {
    j.at("id").get_to(segment.id);
    j.at("text").get_to(segment.text);
    j.at("start").get_to(segment.start);
    j.at("end").get_to(segment.end);
    segment.confidence = j.value("confidence", 0.0f);
    segment.speaker.reset();
    if (j.contains("speaker") && j.at("speaker").is_string()) {
        segment.speaker = j.at("speaker").get<std::string>();
    }
    segment.words.clear();
    if (j.contains("words")) {
        j.at("words").get_to(segment.words);
    }
}

void to_json(json& j, const TranscriptionResult& result) {
    j = json{
        {"text", result.text},
        {"segments", result.segments},
        {"language", result.language},
        {"duration", result.duration},
        {"warnings", result.warnings}
    };
}

void from_json(const json& j, TranscriptionResult& result) {
    j.at("text").get_to(result.text);
    j.at("segments").get_to(result.segments);
    j.at("language").get_to(result.language);
    j.at("duration").get_to(result.duration);
    result.warnings = j.value("warnings", std::vector<std::string>{});
}

} // namespace stt

namespace core {

void to_json(json& j, const JobOptions& options) {
    j = json{
        {"language", options.language ? json(*options.language) : json(nullptr)},
        {"model_size", modelSizeToString(options.model_size)},
        {"enable_diarization", options.enable_diarization},
        {"num_speakers", options.num_speakers ? json(*options.num_speakers) : json(nullptr)}
    };
}

void from_json(const json& j, JobOptions& options) {
    options = JobOptions();
    if (j.contains("language") && j.at("language").is_string()) {
        options.language = j.at("language").get<std::string>();
    }
    auto size = parseModelSize(j.value("model_size", std::string("base")));
    if (!size) {
        throw utils::ValidationException("Unknown model size", j.value("model_size", std::string()));
    }
    options.model_size = *size;
    options.enable_diarization = j.value("enable_diarization", false);
    if (j.contains("num_speakers") && j.at("num_speakers").is_number_integer()) {
        options.num_speakers = j.at("num_speakers").get<int>();
    }
}

void to_json(json& j, const JobError& error) {
    j = json{{"code", error.code}, {"message", error.message}};
}

void from_json(const json& j, JobError& error) {
    j.at("code").get_to(error.code);
    j.at("message").get_to(error.message);
}

void to_json(json& j, const Job& job) {
    j = json{
        {"job_id", job.id},
        {"status", jobStatusToString(job.status)},
        {"progress", job.progress},
        {"options", job.options},
        {"file_name", job.source.file_name},
        {"stored_path", job.source.stored_path},
        {"result", job.result ? json(*job.result) : json(nullptr)},
        {"error", job.error ? json(*job.error) : json(nullptr)},
        {"created_at", utils::formatTimestamp(job.created_at)},
        {"started_at", job.started_at ? json(utils::formatTimestamp(*job.started_at)) : json(nullptr)},
        {"completed_at", job.completed_at ? json(utils::formatTimestamp(*job.completed_at)) : json(nullptr)}
    };
    if (auto seconds = job.processingSeconds()) {
        j["processing_time"] = *seconds;
    }
}

void from_json(const json& j, Job& job) {
    job = Job();
    j.at("job_id").get_to(job.id);
    job.status = jobStatusFromString(j.at("status").get<std::string>());
    j.at("progress").get_to(job.progress);
    if (j.contains("options")) {
        j.at("options").get_to(job.options);
    }
    job.source.file_name = j.value("file_name", std::string());
    job.source.stored_path = j.value("stored_path", std::string());
    if (j.contains("result") && j.at("result").is_object()) {
        job.result = j.at("result").get<stt::TranscriptionResult>();
    }
    if (j.contains("error") && j.at("error").is_object()) {
        job.error = j.at("error").get<JobError>();
    }
    job.created_at = utils::parseTimestamp(j.at("created_at").get<std::string>());
    if (j.contains("started_at") && j.at("started_at").is_string()) {
        job.started_at = utils::parseTimestamp(j.at("started_at").get<std::string>());
    }
    if (j.contains("completed_at") && j.at("completed_at").is_string()) {
        job.completed_at = utils::parseTimestamp(j.at("completed_at").get<std::string>());
    }
}

} // namespace core

} // namespace speechjobs
