#include "audio/audio_preprocessor.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/test_data_generator.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace speechjobs;
using namespace speechjobs::audio;

class AudioPreprocessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.chunk_threshold_seconds = 600.0;
        settings.chunk_duration_seconds = 30.0;
        settings.retain_processed_audio = false;
        preprocessor = makePreprocessor();
    }

    std::unique_ptr<AudioPreprocessor> makePreprocessor(size_t maxUploadMb = 500) {
        auto p = std::make_unique<AudioPreprocessor>(settings, maxUploadMb, dir.file("processed"));
        p->addDecoder(std::make_shared<WavAudioDecoder>());
        return p;
    }

    std::string writeWav(const std::string& name, const std::vector<float>& samples,
                         int sampleRate = 16000, int channels = 1) {
        auto path = dir.file(name);
        generator.saveAudioToFile(samples, path, sampleRate, channels);
        return path;
    }

    fixtures::TempDirectory dir;
    fixtures::TestDataGenerator generator;
    utils::AudioSettings settings;
    std::unique_ptr<AudioPreprocessor> preprocessor;
};

TEST_F(AudioPreprocessorTest, ValidateAcceptsSupportedFormats) {
    EXPECT_NO_THROW(preprocessor->validate("meeting.wav", 1024));
    EXPECT_NO_THROW(preprocessor->validate("Interview.MP3", 1024));
    EXPECT_NO_THROW(preprocessor->validate("clip.webm", 1024));
}

TEST_F(AudioPreprocessorTest, ValidateRejectsBadUploads) {
    EXPECT_THROW(preprocessor->validate("notes.txt", 1024), utils::ValidationException);
    EXPECT_THROW(preprocessor->validate("noextension", 1024), utils::ValidationException);
    EXPECT_THROW(preprocessor->validate("empty.wav", 0), utils::ValidationException);

    auto small = makePreprocessor(1);
    EXPECT_NO_THROW(small->validate("ok.wav", 1024 * 1024));
    try {
        small->validate("big.wav", 2 * 1024 * 1024);
        FAIL() << "Expected ValidationException";
    } catch (const utils::ValidationException& e) {
        EXPECT_EQ(e.getErrorInfo().message, "File too large");
    }
}

TEST_F(AudioPreprocessorTest, ExtensionOfIsLowerCase) {
    EXPECT_EQ(AudioPreprocessor::extensionOf("Talk.WAV"), ".wav");
    EXPECT_EQ(AudioPreprocessor::extensionOf("archive.tar.gz"), ".gz");
    EXPECT_EQ(AudioPreprocessor::extensionOf("README"), "");
}

TEST_F(AudioPreprocessorTest, PrepareNormalizesStereo44k) {
    auto left = generator.generateTone(440.0f, 2.0f, 44100);
    auto right = generator.generateTone(660.0f, 2.0f, 44100);
    auto input = writeWav("stereo.wav", fixtures::TestDataGenerator::interleave(left, right), 44100, 2);

    auto asset = preprocessor->prepare(input, "stereo.wav", "job1");

    EXPECT_EQ(asset->sampleRate(), 16000u);
    EXPECT_EQ(asset->channels(), 1);
    EXPECT_EQ(asset->sourceSampleRate(), 44100u);
    EXPECT_EQ(asset->sourceChannels(), 2);
    EXPECT_EQ(asset->sourceFormat(), "wav");
    EXPECT_NEAR(asset->duration(), 2.0, 0.01);
    EXPECT_FALSE(asset->isChunked());

    auto normalized = WavCodec::readFile(asset->path());
    EXPECT_EQ(normalized.sampleRate, 16000u);
    EXPECT_EQ(normalized.channels, 1);
    EXPECT_EQ(normalized.codec, AudioCodec::PCM_16);
}

TEST_F(AudioPreprocessorTest, LongInputIsChunked) {
    settings.chunk_threshold_seconds = 2.0;
    settings.chunk_duration_seconds = 1.0;
    preprocessor = makePreprocessor();
    auto input = writeWav("long.wav", generator.generateWhiteNoise(3.5f));

    auto asset = preprocessor->prepare(input, "long.wav", "job2");

    ASSERT_TRUE(asset->isChunked());
    const auto& chunks = asset->chunks();
    // The 0.5s tail is folded into the last chunk
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_DOUBLE_EQ(chunks[0].offset, 0.0);
    EXPECT_DOUBLE_EQ(chunks[1].offset, 1.0);
    EXPECT_DOUBLE_EQ(chunks[2].offset, 2.0);
    EXPECT_DOUBLE_EQ(chunks[2].duration, 1.5);

    double total = 0.0;
    for (const auto& chunk : chunks) {
        EXPECT_EQ(chunk.index, static_cast<size_t>(&chunk - &chunks[0]));
        EXPECT_TRUE(std::filesystem::exists(chunk.path));
        total += chunk.duration;
    }
    EXPECT_DOUBLE_EQ(total, asset->duration());
}

TEST_F(AudioPreprocessorTest, TinyChunkDurationIsRaisedToOneSecond) {
    settings.chunk_threshold_seconds = 2.0;
    settings.chunk_duration_seconds = 1e-6;
    preprocessor = makePreprocessor();
    auto input = writeWav("tiny.wav", generator.generateWhiteNoise(3.5f));

    auto asset = preprocessor->prepare(input, "tiny.wav", "job_tiny");

    ASSERT_EQ(asset->chunks().size(), 3u);
    EXPECT_DOUBLE_EQ(asset->chunks()[1].offset, 1.0);
}

TEST_F(AudioPreprocessorTest, ShortInputIsNotChunked) {
    settings.chunk_threshold_seconds = 2.0;
    settings.chunk_duration_seconds = 1.0;
    preprocessor = makePreprocessor();
    auto input = writeWav("short.wav", generator.generateWhiteNoise(1.5f));

    EXPECT_FALSE(preprocessor->prepare(input, "short.wav", "job3")->isChunked());
}

TEST_F(AudioPreprocessorTest, AssetRemovesItsFiles) {
    settings.chunk_threshold_seconds = 1.0;
    settings.chunk_duration_seconds = 1.0;
    preprocessor = makePreprocessor();
    auto input = writeWav("input.wav", generator.generateWhiteNoise(2.5f));

    auto asset = preprocessor->prepare(input, "input.wav", "job4");
    std::vector<std::string> files = {asset->path()};
    for (const auto& chunk : asset->chunks()) {
        files.push_back(chunk.path);
    }
    asset.reset();

    for (const auto& file : files) {
        EXPECT_FALSE(std::filesystem::exists(file)) << file;
    }
    EXPECT_TRUE(std::filesystem::exists(input));
}

TEST_F(AudioPreprocessorTest, RetainedAssetKeepsItsFiles) {
    settings.retain_processed_audio = true;
    preprocessor = makePreprocessor();
    auto input = writeWav("keep.wav", generator.generateWhiteNoise(0.5f));

    auto asset = preprocessor->prepare(input, "keep.wav", "job5");
    auto path = asset->path();
    asset.reset();
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(AudioPreprocessorTest, ZeroDurationFails) {
    auto input = writeWav("empty.wav", {});
    EXPECT_THROW(preprocessor->prepare(input, "empty.wav", "job6"), utils::AudioProcessingException);
}

TEST_F(AudioPreprocessorTest, CorruptFileFails) {
    auto path = dir.file("corrupt.wav");
    fixtures::TestDataGenerator::writeBytes(path, "definitely not audio");
    EXPECT_THROW(preprocessor->prepare(path, "corrupt.wav", "job7"), utils::AudioProcessingException);
}

TEST_F(AudioPreprocessorTest, MissingDecoderFails) {
    auto input = writeWav("song.wav", generator.generateWhiteNoise(0.5f));
    try {
        preprocessor->prepare(input, "song.flac", "job8");
        FAIL() << "Expected AudioProcessingException";
    } catch (const utils::AudioProcessingException& e) {
        EXPECT_EQ(e.getErrorInfo().details, ".flac");
    }
}
