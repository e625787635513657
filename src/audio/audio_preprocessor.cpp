#include "audio/audio_preprocessor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <sstream>

namespace speechjobs {
namespace audio {

namespace fs = std::filesystem;

namespace {

// A tail shorter than this is folded into the previous chunk
constexpr double kMinTailChunkSeconds = 1.0;
constexpr double kMinChunkSeconds = 1.0;

std::string formatMegabytes(uint64_t bytes) {
    std::ostringstream ss;
    ss.precision(1);
    ss << std::fixed << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return ss.str();
}

} // namespace

// AudioAsset implementation
AudioAsset::AudioAsset(std::string path, double duration, uint32_t sampleRate, uint16_t channels,
                       std::string sourceFormat, uint32_t sourceSampleRate, uint16_t sourceChannels,
                       std::vector<AudioChunk> chunks, bool retainFiles)
    : path_(std::move(path)), duration_(duration), sample_rate_(sampleRate), channels_(channels),
      source_format_(std::move(sourceFormat)), source_sample_rate_(sourceSampleRate),
      source_channels_(sourceChannels), chunks_(std::move(chunks)), retain_files_(retainFiles) {
}

AudioAsset::~AudioAsset() {
    if (retain_files_) {
        return;
    }
    std::error_code ec;
    for (const auto& chunk : chunks_) {
        fs::remove(chunk.path, ec);
    }
    if (!fs::remove(path_, ec) && ec) {
        utils::Logger::warn("Failed to remove processed audio " + path_ + ": " + ec.message());
    }
}

// AudioPreprocessor implementation
AudioPreprocessor::AudioPreprocessor(const utils::AudioSettings& settings, size_t maxUploadSizeMb,
                                     const std::string& processedDir)
    : settings_(settings),
      max_upload_bytes_(static_cast<uint64_t>(maxUploadSizeMb) * 1024 * 1024),
      processed_dir_(processedDir) {
}

void AudioPreprocessor::addDecoder(std::shared_ptr<AudioDecoder> decoder) {
    if (decoder) {
        decoders_.push_back(std::move(decoder));
    }
}

const std::set<std::string>& AudioPreprocessor::supportedExtensions() {
    static const std::set<std::string> extensions = {
        ".wav", ".mp3", ".m4a", ".flac", ".ogg", ".aac", ".wma",
        ".mp4", ".webm", ".mkv", ".mov"
    };
    return extensions;
}

std::string AudioPreprocessor::extensionOf(const std::string& fileName) {
    std::string extension = fs::path(fileName).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

void AudioPreprocessor::validate(const std::string& declaredName, uint64_t byteSize) const {
    std::string extension = extensionOf(declaredName);
    if (extension.empty() || supportedExtensions().count(extension) == 0) {
        std::ostringstream allowed;
        bool first = true;
        for (const auto& ext : supportedExtensions()) {
            allowed << (first ? "" : ", ") << ext;
            first = false;
        }
        throw utils::ValidationException(
            "Unsupported file format" + (extension.empty() ? std::string() : ": " + extension),
            "Supported formats: " + allowed.str());
    }

    if (byteSize == 0) {
        throw utils::ValidationException("Empty file", declaredName);
    }

    if (byteSize > max_upload_bytes_) {
        throw utils::ValidationException("File too large",
            formatMegabytes(byteSize) + " exceeds the " + formatMegabytes(max_upload_bytes_) + " limit");
    }
}

std::shared_ptr<AudioDecoder> AudioPreprocessor::decoderFor(const std::string& extension) const {
    for (const auto& decoder : decoders_) {
        if (decoder->canDecode(extension)) {
            return decoder;
        }
    }
    return nullptr;
}

std::vector<AudioChunk> AudioPreprocessor::writeChunks(const std::vector<float>& samples,
                                                      const std::string& outputStem) const {
    double chunkSeconds = std::max(settings_.chunk_duration_seconds, kMinChunkSeconds);
    size_t chunkSamples = static_cast<size_t>(chunkSeconds * kTargetSampleRate);
    size_t minTail = static_cast<size_t>(kMinTailChunkSeconds * kTargetSampleRate);
    std::vector<AudioChunk> chunks;

    try {
        size_t begin = 0;
        while (begin < samples.size()) {
            size_t end = std::min(begin + chunkSamples, samples.size());
            if (samples.size() - end < minTail) {
                end = samples.size();
            }

            AudioChunk chunk;
            chunk.index = chunks.size();
            chunk.offset = static_cast<double>(begin) / kTargetSampleRate;
            chunk.duration = static_cast<double>(end - begin) / kTargetSampleRate;
            chunk.path = (fs::path(processed_dir_) /
                          (outputStem + "_chunk_" + std::to_string(chunk.index) + ".wav")).string();

            std::vector<float> slice(samples.begin() + static_cast<std::ptrdiff_t>(begin),
                                     samples.begin() + static_cast<std::ptrdiff_t>(end));
            WavCodec::writeFile(chunk.path, slice, kTargetSampleRate, kTargetChannels);
            chunks.push_back(chunk);

            begin = end;
        }
    } catch (const utils::AudioProcessingException&) {
        std::error_code ec;
        for (const auto& chunk : chunks) {
            fs::remove(chunk.path, ec);
        }
        throw;
    }

    return chunks;
}

AudioAssetPtr AudioPreprocessor::prepare(const std::string& sourcePath, const std::string& declaredName,
                                         const std::string& outputStem) const {
    std::string extension = extensionOf(declaredName);
    auto decoder = decoderFor(extension);
    if (!decoder) {
        throw utils::AudioProcessingException("No decoder available for format",
                                              extension.empty() ? declaredName : extension);
    }

    utils::Logger::debug("Decoding " + sourcePath + " with " + decoder->name() + " decoder");
    PcmAudio decoded = decoder->decode(sourcePath);

    std::vector<float> samples = AudioFormatConverter::toTargetFormat(decoded);
    double duration = static_cast<double>(samples.size()) / kTargetSampleRate;
    if (samples.empty()) {
        throw utils::AudioProcessingException("Audio has zero duration", declaredName);
    }

    std::error_code ec;
    fs::create_directories(processed_dir_, ec);
    if (ec) {
        throw utils::AudioProcessingException("Cannot create processed audio directory",
                                              processed_dir_ + ": " + ec.message());
    }

    std::string normalizedPath = (fs::path(processed_dir_) / (outputStem + ".wav")).string();
    WavCodec::writeFile(normalizedPath, samples, kTargetSampleRate, kTargetChannels);

    std::vector<AudioChunk> chunks;
    if (duration > settings_.chunk_threshold_seconds) {
        try {
            chunks = writeChunks(samples, outputStem);
        } catch (const utils::AudioProcessingException&) {
            fs::remove(normalizedPath, ec);
            throw;
        }
        utils::Logger::info("Split " + declaredName + " (" + std::to_string(duration) + "s) into " +
                            std::to_string(chunks.size()) + " chunks");
    }

    std::string sourceFormat = extension.empty() ? std::string("unknown") : extension.substr(1);
    return std::make_shared<AudioAsset>(normalizedPath, duration, kTargetSampleRate, kTargetChannels,
                                        sourceFormat, decoded.sampleRate, decoded.channels,
                                        std::move(chunks), settings_.retain_processed_audio);
}

} // namespace audio
} // namespace speechjobs
