#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>

namespace speechjobs {
namespace audio {

namespace {

constexpr uint16_t kWaveFormatPcm = 1;
constexpr uint16_t kWaveFormatFloat = 3;
constexpr uint16_t kWaveFormatExtensible = 0xFFFE;

uint16_t readU16(std::string_view bytes, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(bytes[offset]) |
                                 (static_cast<uint8_t>(bytes[offset + 1]) << 8));
}

uint32_t readU32(std::string_view bytes, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 3])) << 24);
}

void appendU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void appendU32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

AudioCodec codecFor(uint16_t formatTag, uint16_t bitsPerSample) {
    if (formatTag == kWaveFormatPcm) {
        switch (bitsPerSample) {
            case 16: return AudioCodec::PCM_16;
            case 24: return AudioCodec::PCM_24;
            case 32: return AudioCodec::PCM_32;
            default: return AudioCodec::UNKNOWN;
        }
    }
    if (formatTag == kWaveFormatFloat && bitsPerSample == 32) {
        return AudioCodec::FLOAT_32;
    }
    return AudioCodec::UNKNOWN;
}

} // namespace

// WavCodec implementation
size_t WavCodec::bytesPerSample(AudioCodec codec) {
    switch (codec) {
        case AudioCodec::PCM_16: return 2;
        case AudioCodec::PCM_24: return 3;
        case AudioCodec::PCM_32: return 4;
        case AudioCodec::FLOAT_32: return 4;
        default: return 0;
    }
}

PcmAudio WavCodec::decode(std::string_view bytes) {
    if (bytes.size() < 12 || bytes.substr(0, 4) != "RIFF" || bytes.substr(8, 4) != "WAVE") {
        throw utils::AudioProcessingException("Failed to decode audio", "not a RIFF/WAVE stream");
    }

    PcmAudio audio;
    bool haveFormat = false;
    size_t offset = 12;

    while (offset + 8 <= bytes.size()) {
        std::string_view chunkId = bytes.substr(offset, 4);
        uint32_t chunkSize = readU32(bytes, offset + 4);
        size_t body = offset + 8;
        size_t available = bytes.size() - body;

        if (chunkId == "fmt ") {
            if (chunkSize < 16 || available < 16) {
                throw utils::AudioProcessingException("Failed to decode audio", "truncated fmt chunk");
            }
            uint16_t formatTag = readU16(bytes, body);
            audio.channels = readU16(bytes, body + 2);
            audio.sampleRate = readU32(bytes, body + 4);
            uint16_t bitsPerSample = readU16(bytes, body + 14);

            if (formatTag == kWaveFormatExtensible && chunkSize >= 26 && available >= 26) {
                formatTag = readU16(bytes, body + 24);
            }

            audio.codec = codecFor(formatTag, bitsPerSample);
            if (audio.codec == AudioCodec::UNKNOWN) {
                throw utils::AudioProcessingException("Unsupported WAV encoding",
                    "format tag " + std::to_string(formatTag) + ", " +
                    std::to_string(bitsPerSample) + " bits");
            }
            if (audio.channels == 0 || audio.sampleRate == 0) {
                throw utils::AudioProcessingException("Failed to decode audio", "invalid channel count or sample rate");
            }
            haveFormat = true;
        } else if (chunkId == "data") {
            if (!haveFormat) {
                throw utils::AudioProcessingException("Failed to decode audio", "data chunk before fmt chunk");
            }
            // Streaming writers leave the size as 0 or 0xFFFFFFFF; take what is present.
            size_t dataSize = std::min<size_t>(chunkSize, available);
            size_t frameBytes = bytesPerSample(audio.codec) * audio.channels;
            dataSize -= dataSize % frameBytes;
            audio.samples = AudioFormatConverter::convertToFloat(bytes.substr(body, dataSize), audio.codec);
            return audio;
        }

        // Chunks are word aligned
        offset = body + chunkSize + (chunkSize & 1);
    }

    throw utils::AudioProcessingException("Failed to decode audio", "no data chunk found");
}

PcmAudio WavCodec::readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw utils::AudioProcessingException("Failed to open audio file", path);
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return decode(bytes);
}

std::vector<uint8_t> WavCodec::encodePcm16(const std::vector<float>& samples,
                                           uint32_t sampleRate, uint16_t channels) {
    std::vector<uint8_t> wavData;
    uint32_t dataSize = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    wavData.reserve(44 + dataSize);

    // RIFF header
    wavData.insert(wavData.end(), {'R', 'I', 'F', 'F'});
    appendU32(wavData, 36 + dataSize);
    wavData.insert(wavData.end(), {'W', 'A', 'V', 'E'});

    // fmt chunk
    wavData.insert(wavData.end(), {'f', 'm', 't', ' '});
    appendU32(wavData, 16);
    appendU16(wavData, kWaveFormatPcm);
    appendU16(wavData, channels);
    appendU32(wavData, sampleRate);
    appendU32(wavData, sampleRate * channels * 2);
    appendU16(wavData, static_cast<uint16_t>(channels * 2));
    appendU16(wavData, 16);

    // data chunk
    wavData.insert(wavData.end(), {'d', 'a', 't', 'a'});
    appendU32(wavData, dataSize);
    for (int16_t sample : AudioFormatConverter::convertToPCM16(samples)) {
        appendU16(wavData, static_cast<uint16_t>(sample));
    }

    return wavData;
}

void WavCodec::writeFile(const std::string& path, const std::vector<float>& samples,
                         uint32_t sampleRate, uint16_t channels) {
    auto bytes = encodePcm16(samples, sampleRate, channels);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw utils::AudioProcessingException("Failed to write audio file", path);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file.good()) {
        throw utils::AudioProcessingException("Failed to write audio file", path);
    }
}

// AudioFormatConverter implementation
std::vector<float> AudioFormatConverter::resample(const std::vector<float>& input,
                                                  uint32_t inputRate, uint32_t outputRate) {
    if (inputRate == outputRate || input.empty()) {
        return input;
    }

    double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    size_t outputSize = static_cast<size_t>(std::llround(input.size() * ratio));
    std::vector<float> output;
    output.reserve(outputSize);

    for (size_t i = 0; i < outputSize; ++i) {
        double srcIndex = static_cast<double>(i) / ratio;
        output.push_back(interpolate(input, srcIndex));
    }

    return output;
}

std::vector<float> AudioFormatConverter::stereoToMono(const std::vector<float>& stereoData) {
    if (stereoData.size() % 2 != 0) {
        utils::Logger::warn("Stereo data size is not even");
    }

    std::vector<float> mono;
    mono.reserve(stereoData.size() / 2);

    for (size_t i = 0; i + 1 < stereoData.size(); i += 2) {
        mono.push_back((stereoData[i] + stereoData[i + 1]) * 0.5f);
    }

    return mono;
}

std::vector<float> AudioFormatConverter::downmixToMono(const std::vector<float>& input, uint16_t channels) {
    if (channels <= 1) {
        return input;
    }
    if (channels == 2) {
        return stereoToMono(input);
    }

    std::vector<float> mono;
    mono.reserve(input.size() / channels);
    for (size_t frame = 0; frame + channels <= input.size(); frame += channels) {
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            sum += input[frame + c];
        }
        mono.push_back(sum / static_cast<float>(channels));
    }
    return mono;
}

std::vector<float> AudioFormatConverter::convertToFloat(std::string_view data, AudioCodec codec) {
    std::vector<float> samples;

    switch (codec) {
        case AudioCodec::PCM_16: {
            size_t sampleCount = data.size() / 2;
            samples.reserve(sampleCount);
            for (size_t i = 0; i < sampleCount; ++i) {
                int16_t value;
                std::memcpy(&value, data.data() + i * 2, sizeof(value));
                samples.push_back(static_cast<float>(value) / 32768.0f);
            }
            break;
        }
        case AudioCodec::PCM_24: {
            const uint8_t* byteData = reinterpret_cast<const uint8_t*>(data.data());
            size_t sampleCount = data.size() / 3;
            samples.reserve(sampleCount);
            for (size_t i = 0; i < sampleCount; ++i) {
                int32_t sample = (byteData[i*3] << 8) | (byteData[i*3+1] << 16) | (byteData[i*3+2] << 24);
                sample >>= 8; // Sign extend
                samples.push_back(static_cast<float>(sample) / 8388608.0f);
            }
            break;
        }
        case AudioCodec::PCM_32: {
            size_t sampleCount = data.size() / 4;
            samples.reserve(sampleCount);
            for (size_t i = 0; i < sampleCount; ++i) {
                int32_t value;
                std::memcpy(&value, data.data() + i * 4, sizeof(value));
                samples.push_back(static_cast<float>(value) / 2147483648.0f);
            }
            break;
        }
        case AudioCodec::FLOAT_32: {
            size_t sampleCount = data.size() / 4;
            samples.resize(sampleCount);
            std::memcpy(samples.data(), data.data(), sampleCount * sizeof(float));
            break;
        }
        default:
            throw utils::AudioProcessingException("Unsupported audio codec for conversion");
    }

    return samples;
}

std::vector<int16_t> AudioFormatConverter::convertToPCM16(const std::vector<float>& samples) {
    std::vector<int16_t> pcm;
    pcm.reserve(samples.size());

    for (float sample : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, sample));
        pcm.push_back(static_cast<int16_t>(clamped * 32767.0f));
    }

    return pcm;
}

std::vector<float> AudioFormatConverter::toTargetFormat(const PcmAudio& audio) {
    auto mono = downmixToMono(audio.samples, audio.channels);
    return resample(mono, audio.sampleRate, kTargetSampleRate);
}

float AudioFormatConverter::interpolate(const std::vector<float>& data, double index) {
    if (data.empty()) return 0.0f;

    size_t i0 = static_cast<size_t>(std::floor(index));
    size_t i1 = i0 + 1;

    if (i0 >= data.size()) return data.back();
    if (i1 >= data.size()) return data[i0];

    float frac = static_cast<float>(index - static_cast<double>(i0));
    return data[i0] * (1.0f - frac) + data[i1] * frac;
}

} // namespace audio
} // namespace speechjobs
