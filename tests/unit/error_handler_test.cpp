#include <gtest/gtest.h>
#include "utils/error_handler.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace speechjobs::utils;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Clear error history before each test
        ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        ErrorHandler::getInstance().clearErrorHistory();
        ErrorHandler::getInstance().setErrorCallback(nullptr);
    }
};

TEST_F(ErrorHandlerTest, ErrorInfoCreation) {
    ErrorInfo error(ErrorKind::TRANSCRIPTION, ErrorSeverity::ERROR,
                    "Test message", "Test details", "Test context", true);

    EXPECT_EQ(error.kind, ErrorKind::TRANSCRIPTION);
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.message, "Test message");
    EXPECT_EQ(error.details, "Test details");
    EXPECT_EQ(error.context, "Test context");
    EXPECT_TRUE(error.transient);
    EXPECT_EQ(error.id.size(), 12u);
    EXPECT_EQ(error.id.rfind("err_", 0), 0u);
}

TEST_F(ErrorHandlerTest, ErrorInfoUniqueIds) {
    ErrorInfo error1(ErrorKind::INTERNAL, ErrorSeverity::WARNING, "Message 1");
    ErrorInfo error2(ErrorKind::INTERNAL, ErrorSeverity::WARNING, "Message 2");

    EXPECT_NE(error1.id, error2.id);
}

TEST_F(ErrorHandlerTest, ExceptionWhatJoinsDetails) {
    TranslationException withDetails("Translation failed", "Model not loaded");
    EXPECT_STREQ(withDetails.what(), "Translation failed: Model not loaded");

    CanceledException canceled;
    EXPECT_STREQ(canceled.what(), "Job was canceled");
}

TEST_F(ErrorHandlerTest, SpecificExceptions) {
    EXPECT_EQ(ValidationException("bad").kind(), ErrorKind::VALIDATION);
    EXPECT_EQ(AudioProcessingException("decode").kind(), ErrorKind::AUDIO_PROCESSING);
    EXPECT_EQ(ModelLoadException("load", "ggml-base.bin").getErrorInfo().details, "ggml-base.bin");
    EXPECT_EQ(InternalException("oops").kind(), ErrorKind::INTERNAL);

    // Capability failures are transient unless stated otherwise
    EXPECT_TRUE(TranscriptionException("stt").isTransient());
    EXPECT_TRUE(DiarizationException("diar").isTransient());
    EXPECT_FALSE(TranslationException("mt", "", false).isTransient());
    EXPECT_FALSE(ModelLoadException("load").isTransient());

    JobNotFoundException notFound("abc");
    EXPECT_EQ(notFound.getErrorInfo().message, "Job abc not found");
    EXPECT_EQ(notFound.kind(), ErrorKind::JOB_NOT_FOUND);

    InvalidStateException invalid("Job is not completed", "abc");
    EXPECT_EQ(invalid.getErrorInfo().details, "abc");
}

TEST_F(ErrorHandlerTest, ErrorCodes) {
    EXPECT_EQ(error_utils::errorKindToCode(ErrorKind::VALIDATION), "VALIDATION_ERROR");
    EXPECT_EQ(error_utils::errorKindToCode(ErrorKind::AUDIO_PROCESSING), "AUDIO_PROCESSING_ERROR");
    EXPECT_EQ(error_utils::errorKindToCode(ErrorKind::MODEL_LOAD), "MODEL_LOAD_ERROR");
    EXPECT_EQ(error_utils::errorKindToCode(ErrorKind::TRANSCRIPTION), "TRANSCRIPTION_ERROR");
    EXPECT_EQ(error_utils::errorKindToCode(ErrorKind::DIARIZATION), "DIARIZATION_ERROR");
    EXPECT_EQ(error_utils::errorKindToCode(ErrorKind::CANCELED), "CANCELED");
    EXPECT_EQ(error_utils::errorKindToCode(ErrorKind::INTERNAL), "INTERNAL_ERROR");
}

TEST_F(ErrorHandlerTest, ClassifyForeignExceptions) {
    std::runtime_error foreign("socket closed");
    auto info = error_utils::classify(foreign);
    EXPECT_EQ(info.kind, ErrorKind::INTERNAL);
    EXPECT_EQ(info.message, "Unexpected internal error");
    EXPECT_EQ(info.details, "socket closed");

    DiarizationException known("Diarization failed", "no embeddings");
    auto knownInfo = error_utils::classify(known);
    EXPECT_EQ(knownInfo.kind, ErrorKind::DIARIZATION);
    EXPECT_EQ(knownInfo.id, known.getErrorInfo().id);
}

TEST_F(ErrorHandlerTest, ThrowErrorKeepsConcreteType) {
    TranslationException original("Translation failed", "pair not supported", false);
    try {
        error_utils::throwError(original.getErrorInfo());
        FAIL() << "Expected TranslationException";
    } catch (const TranslationException& e) {
        EXPECT_EQ(e.getErrorInfo().id, original.getErrorInfo().id);
        EXPECT_EQ(e.getErrorInfo().details, "pair not supported");
        EXPECT_FALSE(e.isTransient());
    }

    EXPECT_THROW(error_utils::throwError(ModelLoadException("Load failed", "small").getErrorInfo()),
                 ModelLoadException);
    EXPECT_THROW(error_utils::throwError(CanceledException().getErrorInfo()), CanceledException);
    EXPECT_THROW(error_utils::throwError(
                     ErrorInfo(ErrorKind::AUDIO_PROCESSING, ErrorSeverity::ERROR, "bad audio")),
                 AudioProcessingException);
}

TEST_F(ErrorHandlerTest, ReportingCountsByKind) {
    auto& handler = ErrorHandler::getInstance();
    handler.reportError(ErrorInfo(ErrorKind::TRANSCRIPTION, ErrorSeverity::ERROR, "one"));
    handler.reportError(ErrorInfo(ErrorKind::TRANSCRIPTION, ErrorSeverity::ERROR, "two"));
    handler.reportError(AudioProcessingException("three"), "job_42");

    EXPECT_EQ(handler.getErrorCount(ErrorKind::TRANSCRIPTION), 2u);
    EXPECT_EQ(handler.getErrorCount(ErrorKind::AUDIO_PROCESSING), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorKind::DIARIZATION), 0u);
    EXPECT_EQ(handler.getTotalErrorCount(), 3u);

    auto recent = handler.getRecentErrors(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "two");
    EXPECT_EQ(recent[1].context, "job_42");

    handler.clearErrorHistory();
    EXPECT_EQ(handler.getTotalErrorCount(), 0u);
    EXPECT_TRUE(handler.getRecentErrors().empty());
}

TEST_F(ErrorHandlerTest, CallbackReceivesErrors) {
    std::vector<std::string> seen;
    ErrorHandler::getInstance().setErrorCallback([&](const ErrorInfo& error) {
        seen.push_back(error.message);
    });

    ErrorHandler::getInstance().reportError(ErrorInfo(ErrorKind::INTERNAL, ErrorSeverity::CRITICAL, "boom"));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "boom");
}

TEST_F(ErrorHandlerTest, ThrowingCallbackIsContained) {
    ErrorHandler::getInstance().setErrorCallback([](const ErrorInfo&) {
        throw std::runtime_error("callback failure");
    });

    EXPECT_NO_THROW(ErrorHandler::getInstance().reportError(
        ErrorInfo(ErrorKind::VALIDATION, ErrorSeverity::WARNING, "bad input")));
    EXPECT_EQ(ErrorHandler::getInstance().getTotalErrorCount(), 1u);
}

// Test concurrent reporting
TEST_F(ErrorHandlerTest, ConcurrentReporting) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([]() {
            for (int i = 0; i < 50; ++i) {
                ErrorHandler::getInstance().reportError(
                    ErrorInfo(ErrorKind::TRANSLATION, ErrorSeverity::INFO, "concurrent"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(ErrorHandler::getInstance().getErrorCount(ErrorKind::TRANSLATION), 200u);
}
