#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace speechjobs {
namespace audio {

// Sample encodings understood by the RIFF/WAV codec
enum class AudioCodec { PCM_16, PCM_24, PCM_32, FLOAT_32, UNKNOWN };

// Target layout required by the recognition capability
constexpr uint32_t kTargetSampleRate = 16000;
constexpr uint16_t kTargetChannels = 1;

// Decoded PCM with its layout. Samples are interleaved when channels > 1.
struct PcmAudio {
  std::vector<float> samples;
  uint32_t sampleRate = 0;
  uint16_t channels = 0;
  AudioCodec codec = AudioCodec::UNKNOWN;

  size_t frameCount() const {
    return channels == 0 ? 0 : samples.size() / channels;
  }
  double durationSeconds() const {
    return sampleRate == 0 ? 0.0
                           : static_cast<double>(frameCount()) / sampleRate;
  }
};

// RIFF/WAV reader and PCM16 writer
class WavCodec {
public:
  /**
   * Parse a RIFF/WAVE byte buffer. Unknown chunks are skipped.
   * @throws AudioProcessingException on malformed or unsupported data
   */
  static PcmAudio decode(std::string_view bytes);

  /**
   * Read and parse a WAV file
   * @throws AudioProcessingException if the file cannot be read or parsed
   */
  static PcmAudio readFile(const std::string &path);

  /**
   * Encode samples as a 16-bit PCM WAV byte buffer
   */
  static std::vector<uint8_t> encodePcm16(const std::vector<float> &samples,
                                          uint32_t sampleRate,
                                          uint16_t channels);

  /**
   * Write samples as a 16-bit PCM WAV file
   * @throws AudioProcessingException if the file cannot be written
   */
  static void writeFile(const std::string &path,
                        const std::vector<float> &samples, uint32_t sampleRate,
                        uint16_t channels);

  static size_t bytesPerSample(AudioCodec codec);
};

// Audio format converter
class AudioFormatConverter {
public:
  // Sample rate conversion (linear interpolation)
  static std::vector<float> resample(const std::vector<float> &input,
                                     uint32_t inputRate, uint32_t outputRate);

  // Channel conversion
  static std::vector<float> stereoToMono(const std::vector<float> &stereoData);
  static std::vector<float> downmixToMono(const std::vector<float> &input,
                                          uint16_t channels);

  // Codec conversion
  static std::vector<float> convertToFloat(std::string_view data,
                                           AudioCodec codec);
  static std::vector<int16_t> convertToPCM16(const std::vector<float> &samples);

  /**
   * Down-mix and resample to the recognition target (mono, 16 kHz)
   */
  static std::vector<float> toTargetFormat(const PcmAudio &audio);

private:
  static float interpolate(const std::vector<float> &data, double index);
};

} // namespace audio
} // namespace speechjobs
