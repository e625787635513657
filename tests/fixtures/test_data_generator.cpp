#include "test_data_generator.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

namespace fixtures {

namespace {

constexpr float kPi = 3.14159265358979f;

template<typename T>
void writeLE(std::ofstream& file, T value, size_t bytes = sizeof(T)) {
    for (size_t i = 0; i < bytes; ++i) {
        file.put(static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xff));
    }
}

} // namespace

std::vector<float> TestDataGenerator::generateTone(float frequency, float duration, int sampleRate,
                                                   float amplitude) const {
    size_t numSamples = static_cast<size_t>(duration * sampleRate);
    std::vector<float> audio(numSamples);
    for (size_t i = 0; i < numSamples; ++i) {
        float t = static_cast<float>(i) / sampleRate;
        audio[i] = amplitude * std::sin(2.0f * kPi * frequency * t);
    }
    return audio;
}

std::vector<float> TestDataGenerator::generateSilence(float duration, int sampleRate) const {
    return std::vector<float>(static_cast<size_t>(duration * sampleRate), 0.0f);
}

std::vector<float> TestDataGenerator::generateWhiteNoise(float duration, int sampleRate, float amplitude,
                                                         uint32_t seed) const {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-amplitude, amplitude);
    std::vector<float> audio(static_cast<size_t>(duration * sampleRate));
    for (auto& sample : audio) {
        sample = dist(gen);
    }
    return audio;
}

std::vector<float> TestDataGenerator::generateAlternatingSpeakers(const std::vector<float>& durations,
                                                                  int sampleRate) const {
    std::vector<std::vector<float>> parts;
    for (size_t i = 0; i < durations.size(); ++i) {
        float frequency = i % 2 == 0 ? 220.0f : 1760.0f;
        parts.push_back(generateTone(frequency, durations[i], sampleRate, 0.5f));
    }
    return concatenate(parts);
}

std::vector<float> TestDataGenerator::concatenate(const std::vector<std::vector<float>>& parts) {
    std::vector<float> audio;
    for (const auto& part : parts) {
        audio.insert(audio.end(), part.begin(), part.end());
    }
    return audio;
}

std::vector<float> TestDataGenerator::interleave(const std::vector<float>& left, const std::vector<float>& right) {
    size_t frames = std::min(left.size(), right.size());
    std::vector<float> audio;
    audio.reserve(frames * 2);
    for (size_t i = 0; i < frames; ++i) {
        audio.push_back(left[i]);
        audio.push_back(right[i]);
    }
    return audio;
}

void TestDataGenerator::saveAudioToFile(const std::vector<float>& audio, const std::string& filename,
                                        int sampleRate, int channels, WavSampleFormat format) const {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot create " + filename);
    }

    uint16_t bitsPerSample = format == WavSampleFormat::PCM_16 ? 16 : (format == WavSampleFormat::PCM_24 ? 24 : 32);
    uint16_t audioFormat = format == WavSampleFormat::FLOAT_32 ? 3 : 1;
    uint32_t bytesPerSample = bitsPerSample / 8;
    uint32_t dataSize = static_cast<uint32_t>(audio.size() * bytesPerSample);

    // WAV header
    file.write("RIFF", 4);
    writeLE<uint32_t>(file, 36 + dataSize);
    file.write("WAVE", 4);

    // Format chunk
    file.write("fmt ", 4);
    writeLE<uint32_t>(file, 16);
    writeLE<uint16_t>(file, audioFormat);
    writeLE<uint16_t>(file, static_cast<uint16_t>(channels));
    writeLE<uint32_t>(file, static_cast<uint32_t>(sampleRate));
    writeLE<uint32_t>(file, static_cast<uint32_t>(sampleRate) * channels * bytesPerSample);
    writeLE<uint16_t>(file, static_cast<uint16_t>(channels * bytesPerSample));
    writeLE<uint16_t>(file, bitsPerSample);

    // Data chunk
    file.write("data", 4);
    writeLE<uint32_t>(file, dataSize);

    for (float sample : audio) {
        float clamped = std::clamp(sample, -1.0f, 1.0f);
        switch (format) {
            case WavSampleFormat::PCM_16:
                writeLE<uint16_t>(file, static_cast<uint16_t>(static_cast<int16_t>(clamped * 32767.0f)));
                break;
            case WavSampleFormat::PCM_24:
                writeLE<uint32_t>(file, static_cast<uint32_t>(static_cast<int32_t>(clamped * 8388607.0f)), 3);
                break;
            case WavSampleFormat::FLOAT_32: {
                uint32_t bits;
                static_assert(sizeof(bits) == sizeof(float), "float must be 32 bits");
                std::memcpy(&bits, &clamped, sizeof(bits));
                writeLE<uint32_t>(file, bits);
                break;
            }
        }
    }
}

void TestDataGenerator::writeBytes(const std::string& filename, const std::string& bytes) {
    std::ofstream file(filename, std::ios::binary);
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

TempDirectory::TempDirectory(const std::string& prefix) {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    auto base = std::filesystem::temp_directory_path();
    do {
        path_ = (base / (prefix + "_" + std::to_string(rd()) + "_" + std::to_string(counter++))).string();
    } while (std::filesystem::exists(path_));
    std::filesystem::create_directories(path_);
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::string TempDirectory::file(const std::string& name) const {
    return (std::filesystem::path(path_) / name).string();
}

} // namespace fixtures
