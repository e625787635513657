#include "audio/ffmpeg_audio_decoder.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

#include <memory>
#include <vector>

namespace speechjobs {
namespace audio {

namespace {

struct FormatContextCloser {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecContextFreer {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct SwrContextFreer {
    void operator()(SwrContext* ctx) const { swr_free(&ctx); }
};
struct PacketFreer {
    void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};
struct FrameFreer {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextFreer>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextFreer>;
using PacketPtr = std::unique_ptr<AVPacket, PacketFreer>;
using FramePtr = std::unique_ptr<AVFrame, FrameFreer>;

[[noreturn]] void fail(const std::string& message, const std::string& path) {
    throw utils::AudioProcessingException("Failed to decode audio", message + ": " + path);
}

void convertFrame(SwrContext* swr, AVCodecContext* codec, AVFrame* frame, std::vector<float>& output) {
    int64_t delay = swr_get_delay(swr, codec->sample_rate);
    int64_t outSamples = av_rescale_rnd(delay + frame->nb_samples, kTargetSampleRate,
                                        codec->sample_rate, AV_ROUND_UP);

    std::vector<float> buffer(static_cast<size_t>(outSamples));
    uint8_t* outBuf = reinterpret_cast<uint8_t*>(buffer.data());

    int converted = swr_convert(swr, &outBuf, static_cast<int>(outSamples),
                                const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
    if (converted > 0) {
        output.insert(output.end(), buffer.begin(), buffer.begin() + converted);
    }
}

} // namespace

bool FfmpegAudioDecoder::canDecode(const std::string& extension) const {
    return !extension.empty();
}

PcmAudio FfmpegAudioDecoder::decode(const std::string& path) {
    AVFormatContext* rawFormat = nullptr;
    if (avformat_open_input(&rawFormat, path.c_str(), nullptr, nullptr) < 0) {
        fail("cannot open input", path);
    }
    FormatContextPtr format(rawFormat);

    if (avformat_find_stream_info(format.get(), nullptr) < 0) {
        fail("cannot read stream info", path);
    }

    int streamIndex = av_find_best_stream(format.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (streamIndex < 0) {
        fail("no audio stream found", path);
    }

    AVCodecParameters* codecpar = format->streams[streamIndex]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
    if (!codec) {
        fail("unsupported audio codec", path);
    }

    CodecContextPtr codecCtx(avcodec_alloc_context3(codec));
    if (!codecCtx) {
        fail("cannot allocate codec context", path);
    }
    if (avcodec_parameters_to_context(codecCtx.get(), codecpar) < 0) {
        fail("cannot copy codec parameters", path);
    }
    if (avcodec_open2(codecCtx.get(), codec, nullptr) < 0) {
        fail("cannot open codec", path);
    }

    // Resample straight to 16 kHz mono float
    AVChannelLayout outLayout = AV_CHANNEL_LAYOUT_MONO;
    AVChannelLayout inLayout;
    if (codecCtx->ch_layout.nb_channels > 0) {
        av_channel_layout_copy(&inLayout, &codecCtx->ch_layout);
    } else {
        av_channel_layout_default(&inLayout, codecpar->ch_layout.nb_channels > 0 ? codecpar->ch_layout.nb_channels : 2);
    }

    SwrContext* rawSwr = nullptr;
    swr_alloc_set_opts2(&rawSwr, &outLayout, AV_SAMPLE_FMT_FLT, kTargetSampleRate, &inLayout,
                        codecCtx->sample_fmt, codecCtx->sample_rate, 0, nullptr);
    SwrContextPtr swr(rawSwr);
    uint16_t sourceChannels = static_cast<uint16_t>(inLayout.nb_channels);
    av_channel_layout_uninit(&inLayout);

    if (!swr || swr_init(swr.get()) < 0) {
        fail("cannot initialize resampler", path);
    }

    PacketPtr packet(av_packet_alloc());
    FramePtr frame(av_frame_alloc());
    if (!packet || !frame) {
        fail("cannot allocate packet or frame", path);
    }

    PcmAudio audio;
    audio.sampleRate = kTargetSampleRate;
    audio.channels = kTargetChannels;
    audio.codec = AudioCodec::FLOAT_32;

    while (av_read_frame(format.get(), packet.get()) >= 0) {
        if (packet->stream_index == streamIndex &&
            avcodec_send_packet(codecCtx.get(), packet.get()) >= 0) {
            while (avcodec_receive_frame(codecCtx.get(), frame.get()) >= 0) {
                convertFrame(swr.get(), codecCtx.get(), frame.get(), audio.samples);
            }
        }
        av_packet_unref(packet.get());
    }

    // Flush decoder
    avcodec_send_packet(codecCtx.get(), nullptr);
    while (avcodec_receive_frame(codecCtx.get(), frame.get()) >= 0) {
        convertFrame(swr.get(), codecCtx.get(), frame.get(), audio.samples);
    }

    // Flush resampler
    int64_t delay = swr_get_delay(swr.get(), kTargetSampleRate);
    if (delay > 0) {
        std::vector<float> buffer(static_cast<size_t>(delay));
        uint8_t* outBuf = reinterpret_cast<uint8_t*>(buffer.data());
        int converted = swr_convert(swr.get(), &outBuf, static_cast<int>(delay), nullptr, 0);
        if (converted > 0) {
            audio.samples.insert(audio.samples.end(), buffer.begin(), buffer.begin() + converted);
        }
    }

    utils::Logger::debug("Decoded " + path + " (" + codec->name + ", " +
                         std::to_string(sourceChannels) + " channel(s), " +
                         std::to_string(codecCtx->sample_rate) + "Hz)");
    return audio;
}

} // namespace audio
} // namespace speechjobs
