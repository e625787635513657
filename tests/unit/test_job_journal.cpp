#include "core/job_journal.hpp"
#include "core/job_json.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "../fixtures/test_data_generator.hpp"
#include "../mocks/mock_capabilities.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>

using namespace speechjobs;
using namespace speechjobs::core;
using nlohmann::json;

class JobJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        journalDir = dir.file("journal");
    }

    Job completedJob(const std::string& id) {
        Job job;
        job.id = id;
        job.status = JobStatus::COMPLETED;
        job.progress = 100;
        job.options.language = "de";
        job.options.model_size = ModelSize::SMALL;
        job.options.enable_diarization = true;
        job.options.num_speakers = 2;
        job.source = {"interview.mp3", "/uploads/" + id + ".mp3"};
        job.created_at = utils::parseTimestamp("2024-05-01T12:00:00.000Z");
        job.started_at = utils::parseTimestamp("2024-05-01T12:00:01.500Z");
        job.completed_at = utils::parseTimestamp("2024-05-01T12:00:11.750Z");

        stt::TranscriptionResult result;
        auto segment = mocks::makeSegment(0, 0.0, 1.2, "Guten Tag", {{"Guten", 0.0, 0.5, 0.9f}, {"Tag", 0.6, 1.2, 0.8f}});
        segment.speaker = "SPEAKER_00";
        result.segments = {segment};
        result.text = "Guten Tag";
        result.language = "de";
        result.duration = 1.2;
        job.result = result;
        return job;
    }

    fixtures::TempDirectory dir;
    std::string journalDir;
};

TEST_F(JobJournalTest, TimestampsRoundTripWithMilliseconds) {
    auto text = "2024-05-01T12:30:00.250Z";
    EXPECT_EQ(utils::formatTimestamp(utils::parseTimestamp(text)), text);
    EXPECT_THROW(utils::parseTimestamp("yesterday"), utils::ValidationException);
}

TEST_F(JobJournalTest, JobJsonUsesPublicFieldNames) {
    json document = completedJob("job_a");

    EXPECT_EQ(document["job_id"], "job_a");
    EXPECT_EQ(document["status"], "completed");
    EXPECT_EQ(document["progress"], 100);
    EXPECT_EQ(document["options"]["model_size"], "small");
    EXPECT_EQ(document["options"]["num_speakers"], 2);
    EXPECT_EQ(document["created_at"], "2024-05-01T12:00:00.000Z");
    EXPECT_DOUBLE_EQ(document["processing_time"].get<double>(), 10.25);
    EXPECT_TRUE(document["error"].is_null());

    const auto& segment = document["result"]["segments"][0];
    EXPECT_EQ(segment["speaker"], "SPEAKER_00");
    EXPECT_EQ(segment["words"][1]["word"], "Tag");
}

TEST_F(JobJournalTest, PendingJobHasNoProcessingTime) {
    Job job;
    job.id = "job_p";
    job.created_at = std::chrono::system_clock::now();
    json document = job;

    EXPECT_EQ(document["status"], "pending");
    EXPECT_FALSE(document.contains("processing_time"));
    EXPECT_TRUE(document["started_at"].is_null());
    EXPECT_TRUE(document["options"]["language"].is_null());
}

TEST_F(JobJournalTest, RecordAndLoad) {
    JobJournal journal(journalDir);
    ASSERT_TRUE(journal.record(completedJob("job_a")));

    Job failed;
    failed.id = "job_b";
    failed.status = JobStatus::FAILED;
    failed.error = JobError{"TRANSCRIPTION_ERROR", "Transcription failed"};
    failed.created_at = utils::parseTimestamp("2024-05-01T13:00:00.000Z");
    ASSERT_TRUE(journal.record(failed));

    auto jobs = journal.loadAll();
    ASSERT_EQ(jobs.size(), 2u);
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) { return a.id < b.id; });

    const auto& restored = jobs[0];
    EXPECT_EQ(restored.status, JobStatus::COMPLETED);
    EXPECT_EQ(restored.options.language, std::optional<std::string>("de"));
    EXPECT_EQ(restored.options.model_size, ModelSize::SMALL);
    EXPECT_EQ(restored.source.stored_path, "/uploads/job_a.mp3");
    ASSERT_TRUE(restored.result.has_value());
    ASSERT_EQ(restored.result->segments.size(), 1u);
    EXPECT_EQ(restored.result->segments[0].words.size(), 2u);
    EXPECT_EQ(restored.result->segments[0].speaker, std::optional<std::string>("SPEAKER_00"));
    EXPECT_EQ(restored.completed_at, completedJob("job_a").completed_at);

    EXPECT_EQ(jobs[1].status, JobStatus::FAILED);
    ASSERT_TRUE(jobs[1].error.has_value());
    EXPECT_EQ(jobs[1].error->code, "TRANSCRIPTION_ERROR");
    EXPECT_FALSE(jobs[1].result.has_value());
}

TEST_F(JobJournalTest, RecordReplacesEarlierSnapshot) {
    JobJournal journal(journalDir);
    auto job = completedJob("job_a");
    job.status = JobStatus::PROCESSING;
    job.progress = 40;
    job.result.reset();
    journal.record(job);
    journal.record(completedJob("job_a"));

    auto jobs = journal.loadAll();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].progress, 100);
}

TEST_F(JobJournalTest, EraseRemovesRecord) {
    JobJournal journal(journalDir);
    journal.record(completedJob("job_a"));
    journal.erase("job_a");
    EXPECT_TRUE(journal.loadAll().empty());

    // Erasing something that was never recorded is harmless
    EXPECT_NO_THROW(journal.erase("job_z"));
}

TEST_F(JobJournalTest, MalformedRecordsAreSkipped) {
    JobJournal journal(journalDir);
    journal.record(completedJob("job_a"));
    fixtures::TestDataGenerator::writeBytes(journalDir + "/broken.json", "{\"job_id\": ");
    fixtures::TestDataGenerator::writeBytes(journalDir + "/wrong.json", R"({"job_id": "x", "status": "exploded"})");
    fixtures::TestDataGenerator::writeBytes(journalDir + "/notes.txt", "ignored");

    auto jobs = journal.loadAll();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].id, "job_a");
}

TEST_F(JobJournalTest, CreatesDirectory) {
    auto nested = dir.file("a/b/c");
    JobJournal journal(nested);
    EXPECT_TRUE(std::filesystem::is_directory(nested));
    EXPECT_EQ(journal.directory(), nested);
}
