#pragma once

#include "audio/audio_decoder.hpp"
#include <string>

namespace speechjobs {
namespace audio {

/**
 * Decoder for compressed audio and video containers backed by FFmpeg.
 * Output is already mono at the recognition sample rate.
 */
class FfmpegAudioDecoder : public AudioDecoder {
public:
    bool canDecode(const std::string& extension) const override;
    PcmAudio decode(const std::string& path) override;
    std::string name() const override { return "ffmpeg"; }
};

} // namespace audio
} // namespace speechjobs
