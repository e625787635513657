#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fixtures {

enum class WavSampleFormat {
    PCM_16,
    PCM_24,
    FLOAT_32
};

/**
 * Synthetic audio for tests
 */
class TestDataGenerator {
public:
    std::vector<float> generateTone(float frequency, float duration, int sampleRate = 16000,
                                    float amplitude = 0.5f) const;
    std::vector<float> generateSilence(float duration, int sampleRate = 16000) const;
    std::vector<float> generateWhiteNoise(float duration, int sampleRate = 16000,
                                          float amplitude = 0.1f, uint32_t seed = 42) const;

    /**
     * Tones of alternating pitch, one per entry, as two speakers taking turns
     */
    std::vector<float> generateAlternatingSpeakers(const std::vector<float>& durations,
                                                   int sampleRate = 16000) const;

    static std::vector<float> concatenate(const std::vector<std::vector<float>>& parts);
    static std::vector<float> interleave(const std::vector<float>& left, const std::vector<float>& right);

    /**
     * Write interleaved samples as a RIFF/WAVE file
     */
    void saveAudioToFile(const std::vector<float>& audio, const std::string& filename,
                         int sampleRate = 16000, int channels = 1,
                         WavSampleFormat format = WavSampleFormat::PCM_16) const;

    /**
     * Write arbitrary bytes, e.g. a corrupt upload
     */
    static void writeBytes(const std::string& filename, const std::string& bytes);
};

/**
 * Unique scratch directory, removed with its contents on destruction
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "speechjobs_test");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const;

private:
    std::string path_;
};

} // namespace fixtures
