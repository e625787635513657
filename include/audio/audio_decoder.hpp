#pragma once

#include "audio/audio_utils.hpp"
#include <string>

namespace speechjobs {
namespace audio {

/**
 * Decodes an input file into float PCM
 */
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    /**
     * @param extension Lower-case extension including the dot, e.g. ".wav"
     */
    virtual bool canDecode(const std::string& extension) const = 0;

    /**
     * Decode a whole file. The returned audio may be in any layout; the
     * preprocessor converts it to the recognition target.
     * @throws AudioProcessingException on decode failure
     */
    virtual PcmAudio decode(const std::string& path) = 0;

    virtual std::string name() const = 0;
};

/**
 * Built-in RIFF/WAV decoder (PCM 16/24/32 bit and 32-bit float)
 */
class WavAudioDecoder : public AudioDecoder {
public:
    bool canDecode(const std::string& extension) const override {
        return extension == ".wav";
    }

    PcmAudio decode(const std::string& path) override {
        return WavCodec::readFile(path);
    }

    std::string name() const override { return "wav"; }
};

} // namespace audio
} // namespace speechjobs
