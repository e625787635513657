#pragma once

#include "core/job.hpp"
#include "stt/transcript.hpp"
#include <nlohmann/json.hpp>

namespace speechjobs {

namespace stt {

void to_json(nlohmann::json& j, const Word& word);
void from_json(const nlohmann::json& j, Word& word);
void to_json(nlohmann::json& j, const TranscriptSegment& segment);
void from_json(const nlohmann::json& j, TranscriptSegment& segment);
void to_json(nlohmann::json& j, const TranscriptionResult& result);
void from_json(const nlohmann::json& j, TranscriptionResult& result);

} // namespace stt

namespace core {

void to_json(nlohmann::json& j, const JobOptions& options);
void from_json(const nlohmann::json& j, JobOptions& options);
void to_json(nlohmann::json& j, const JobError& error);
void from_json(const nlohmann::json& j, JobError& error);

/**
 * Full job record, as served by status queries and stored in the journal
 */
void to_json(nlohmann::json& j, const Job& job);
void from_json(const nlohmann::json& j, Job& job);

} // namespace core

} // namespace speechjobs
