#include "core/capability_call.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace speechjobs;
using namespace speechjobs::core;

class CapabilityCallTest : public ::testing::Test {
protected:
    void SetUp() override {
        retry.max_attempts = 2;
        retry.backoff_ms = 0;
    }

    utils::RetrySettings retry;
    CancellationToken token;
};

TEST_F(CapabilityCallTest, SuccessIsOk) {
    auto outcome = invokeWithRetry([]() { return 42; }, retry, token, "answer");
    EXPECT_TRUE(outcome.isOk());
    EXPECT_EQ(outcome.value(), 42);
}

TEST_F(CapabilityCallTest, TransientFailureIsRetriedOnce) {
    int calls = 0;
    auto outcome = invokeWithRetry([&]() {
        if (++calls == 1) {
            throw utils::DiarizationException("Diarization failed", "temporary");
        }
        return std::string("turns");
    }, retry, token, "diarize");

    EXPECT_EQ(calls, 2);
    ASSERT_TRUE(outcome.isOk());
    EXPECT_EQ(outcome.value(), "turns");
}

TEST_F(CapabilityCallTest, RepeatedTransientFailureIsFatal) {
    int calls = 0;
    auto outcome = invokeWithRetry([&]() -> int {
        ++calls;
        throw utils::DiarizationException("Diarization failed", "still broken");
    }, retry, token, "diarize");

    EXPECT_EQ(calls, 2);
    ASSERT_TRUE(outcome.isFatal());
    EXPECT_EQ(outcome.error().kind, utils::ErrorKind::DIARIZATION);
    EXPECT_EQ(outcome.error().message, "Diarization failed");
}

TEST_F(CapabilityCallTest, PermanentFailureIsNotRetried) {
    int calls = 0;
    auto outcome = invokeWithRetry([&]() -> int {
        ++calls;
        throw utils::ModelLoadException("Model missing", "ggml-base.bin");
    }, retry, token, "load");

    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(outcome.isFatal());
    EXPECT_EQ(outcome.error().kind, utils::ErrorKind::MODEL_LOAD);
}

TEST_F(CapabilityCallTest, CancellationPropagates) {
    token.cancel("stop now");
    int calls = 0;
    EXPECT_THROW(invokeWithRetry([&]() { return ++calls; }, retry, token, "never"),
                 utils::CanceledException);
    EXPECT_EQ(calls, 0);
}

TEST_F(CapabilityCallTest, CancellationBetweenAttemptsStopsRetry) {
    int calls = 0;
    EXPECT_THROW(invokeWithRetry([&]() -> int {
        ++calls;
        token.cancel();
        throw utils::TranscriptionException("Transcription failed");
    }, retry, token, "transcribe"), utils::CanceledException);
    EXPECT_EQ(calls, 1);
}

TEST_F(CapabilityCallTest, ForeignExceptionsPropagate) {
    EXPECT_THROW(invokeWithRetry([]() -> int { throw std::logic_error("bug"); }, retry, token, "buggy"),
                 std::logic_error);
}

TEST_F(CapabilityCallTest, DegradedCarriesValueAndWarning) {
    auto outcome = CallOutcome<std::vector<int>>::degraded({}, "no speakers");
    EXPECT_TRUE(outcome.isDegraded());
    EXPECT_TRUE(outcome.value().empty());
    EXPECT_EQ(outcome.warning(), "no speakers");
}
