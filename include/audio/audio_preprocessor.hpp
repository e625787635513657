#pragma once

#include "audio/audio_decoder.hpp"
#include "utils/config.hpp"
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace speechjobs {
namespace audio {

/**
 * Slice of a normalized asset, positioned on the original timeline
 */
struct AudioChunk {
    size_t index = 0;
    std::string path;
    double offset = 0.0;   // seconds from the start of the asset
    double duration = 0.0;
};

/**
 * Normalized (mono, 16 kHz, PCM16 WAV) rendition of a job's input.
 * Owns its files: unless retained, they are deleted when the asset is
 * destroyed.
 */
class AudioAsset {
public:
    AudioAsset(std::string path, double duration, uint32_t sampleRate, uint16_t channels,
               std::string sourceFormat, uint32_t sourceSampleRate, uint16_t sourceChannels,
               std::vector<AudioChunk> chunks, bool retainFiles);
    ~AudioAsset();

    AudioAsset(const AudioAsset&) = delete;
    AudioAsset& operator=(const AudioAsset&) = delete;

    const std::string& path() const { return path_; }
    double duration() const { return duration_; }
    uint32_t sampleRate() const { return sample_rate_; }
    uint16_t channels() const { return channels_; }
    const std::string& sourceFormat() const { return source_format_; }
    uint32_t sourceSampleRate() const { return source_sample_rate_; }
    uint16_t sourceChannels() const { return source_channels_; }

    /**
     * Chunks in timeline order. Empty when the asset is processed whole.
     */
    const std::vector<AudioChunk>& chunks() const { return chunks_; }
    bool isChunked() const { return !chunks_.empty(); }

    bool retainsFiles() const { return retain_files_; }

private:
    std::string path_;
    double duration_;
    uint32_t sample_rate_;
    uint16_t channels_;
    std::string source_format_;
    uint32_t source_sample_rate_;
    uint16_t source_channels_;
    std::vector<AudioChunk> chunks_;
    bool retain_files_;
};

using AudioAssetPtr = std::shared_ptr<AudioAsset>;

/**
 * Validates uploads and turns them into AudioAssets
 */
class AudioPreprocessor {
public:
    AudioPreprocessor(const utils::AudioSettings& settings, size_t maxUploadSizeMb,
                      const std::string& processedDir);

    /**
     * Add a decoder. Decoders are tried in registration order.
     */
    void addDecoder(std::shared_ptr<AudioDecoder> decoder);

    /**
     * Admission check run before any job exists
     * @throws ValidationException for unsupported extensions, empty files or
     *         files above the size ceiling
     */
    void validate(const std::string& declaredName, uint64_t byteSize) const;

    /**
     * Decode, normalize and (for long inputs) chunk a file
     * @param sourcePath File to read
     * @param declaredName Client file name; its extension selects the decoder
     * @param outputStem Base name for the normalized files, e.g. the job id
     * @throws AudioProcessingException on decode failure or zero duration
     */
    AudioAssetPtr prepare(const std::string& sourcePath, const std::string& declaredName,
                          const std::string& outputStem) const;

    static const std::set<std::string>& supportedExtensions();

    /**
     * Lower-cased extension including the dot, or "" if none
     */
    static std::string extensionOf(const std::string& fileName);

    uint64_t maxUploadBytes() const { return max_upload_bytes_; }

private:
    std::shared_ptr<AudioDecoder> decoderFor(const std::string& extension) const;
    std::vector<AudioChunk> writeChunks(const std::vector<float>& samples,
                                        const std::string& outputStem) const;

    utils::AudioSettings settings_;
    uint64_t max_upload_bytes_;
    std::string processed_dir_;
    std::vector<std::shared_ptr<AudioDecoder>> decoders_;
};

} // namespace audio
} // namespace speechjobs
