/**
 * Segue Engine - Audio Decoder Implementation
 *
 * Uses FFmpeg for demuxing, decoding and resampling.
 */

#include "decoder.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

#include <vector>

namespace segue {

class Decoder::Impl {
public:
    Result<AudioInfo> probe(const std::string& path) {
        AVFormatContext* format_ctx = nullptr;

        if (avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr) < 0) {
            return ResultError("Failed to open file: " + path);
        }

        if (avformat_find_stream_info(format_ctx, nullptr) < 0) {
            avformat_close_input(&format_ctx);
            return "Failed to find stream info";
        }

        int stream_idx = av_find_best_stream(format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        if (stream_idx < 0) {
            avformat_close_input(&format_ctx);
            return "No audio stream found";
        }

        AVCodecParameters* codecpar = format_ctx->streams[stream_idx]->codecpar;

        AudioInfo info;
        info.sample_rate = codecpar->sample_rate;
        info.channels = codecpar->ch_layout.nb_channels;
        if (format_ctx->duration > 0) {
            info.duration = static_cast<float>(format_ctx->duration) / AV_TIME_BASE;
        }
        const char* codec_name = avcodec_get_name(codecpar->codec_id);
        info.codec = codec_name ? codec_name : "";

        avformat_close_input(&format_ctx);
        return info;
    }

    Result<AudioBuffer> decode(const std::string& path, const DecodeOptions& options) {
        AVFormatContext* format_ctx = nullptr;
        AVCodecContext* codec_ctx = nullptr;
        SwrContext* swr_ctx = nullptr;
        AVPacket* packet = nullptr;
        AVFrame* frame = nullptr;
        AVChannelLayout in_ch_layout{};
        AVChannelLayout out_ch_layout{};

        // Cleanup helper
        auto cleanup = [&]() {
            if (frame) av_frame_free(&frame);
            if (packet) av_packet_free(&packet);
            if (swr_ctx) swr_free(&swr_ctx);
            if (codec_ctx) avcodec_free_context(&codec_ctx);
            if (format_ctx) avformat_close_input(&format_ctx);
            av_channel_layout_uninit(&in_ch_layout);
            av_channel_layout_uninit(&out_ch_layout);
        };

        // Open file
        int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
        if (ret < 0) {
            cleanup();
            return ResultError("Failed to open file: " + path);
        }

        ret = avformat_find_stream_info(format_ctx, nullptr);
        if (ret < 0) {
            cleanup();
            return "Failed to find stream info";
        }

        int audio_stream_idx = av_find_best_stream(format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        if (audio_stream_idx < 0) {
            cleanup();
            return "No audio stream found";
        }

        AVCodecParameters* codecpar = format_ctx->streams[audio_stream_idx]->codecpar;

        const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
        if (!codec) {
            cleanup();
            return "Unsupported codec";
        }

        codec_ctx = avcodec_alloc_context3(codec);
        if (!codec_ctx) {
            cleanup();
            return "Failed to allocate codec context";
        }

        ret = avcodec_parameters_to_context(codec_ctx, codecpar);
        if (ret < 0) {
            cleanup();
            return "Failed to copy codec parameters";
        }

        ret = avcodec_open2(codec_ctx, codec, nullptr);
        if (ret < 0) {
            cleanup();
            return "Failed to open codec";
        }

        // Input layout: trust the codec, fall back to a default layout
        if (codec_ctx->ch_layout.nb_channels > 0 &&
            codec_ctx->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC) {
            av_channel_layout_copy(&in_ch_layout, &codec_ctx->ch_layout);
        } else {
            int n = codec_ctx->ch_layout.nb_channels > 0 ? codec_ctx->ch_layout.nb_channels : 2;
            av_channel_layout_default(&in_ch_layout, n);
        }

        int in_sample_rate = codec_ctx->sample_rate > 0 ? codec_ctx->sample_rate : 44100;

        AudioBuffer buffer;
        buffer.sample_rate = options.sample_rate > 0 ? options.sample_rate : in_sample_rate;

        if (options.channels > 0 && options.channels != in_ch_layout.nb_channels) {
            av_channel_layout_default(&out_ch_layout, options.channels);
        } else {
            av_channel_layout_copy(&out_ch_layout, &in_ch_layout);
        }
        buffer.channels = out_ch_layout.nb_channels;

        ret = swr_alloc_set_opts2(&swr_ctx,
            &out_ch_layout,
            AV_SAMPLE_FMT_FLT,
            buffer.sample_rate,
            &in_ch_layout,
            codec_ctx->sample_fmt,
            in_sample_rate,
            0, nullptr);

        if (ret < 0 || !swr_ctx) {
            cleanup();
            return "Failed to create resampler";
        }

        ret = swr_init(swr_ctx);
        if (ret < 0) {
            cleanup();
            return "Failed to initialize resampler";
        }

        packet = av_packet_alloc();
        frame = av_frame_alloc();
        if (!packet || !frame) {
            cleanup();
            return "Failed to allocate packet/frame";
        }

        if (format_ctx->duration > 0) {
            int64_t duration_samples = av_rescale_q(format_ctx->duration,
                AV_TIME_BASE_Q, AVRational{1, buffer.sample_rate});
            buffer.samples.reserve(static_cast<size_t>(duration_samples) * buffer.channels);
        }

        std::vector<float> out_buffer;

        // Resample one decoded frame (or flush with nullptr) and append
        auto append = [&](const uint8_t** in_data, int in_samples) {
            int out_samples = static_cast<int>(av_rescale_rnd(
                swr_get_delay(swr_ctx, in_sample_rate) + in_samples,
                buffer.sample_rate, in_sample_rate, AV_ROUND_UP));
            if (out_samples <= 0) return;

            out_buffer.resize(static_cast<size_t>(out_samples) * buffer.channels);
            uint8_t* out_ptr = reinterpret_cast<uint8_t*>(out_buffer.data());

            int converted = swr_convert(swr_ctx, &out_ptr, out_samples, in_data, in_samples);
            if (converted > 0) {
                buffer.samples.insert(buffer.samples.end(),
                    out_buffer.begin(),
                    out_buffer.begin() + static_cast<size_t>(converted) * buffer.channels);
            }
        };

        auto drain = [&]() {
            while (avcodec_receive_frame(codec_ctx, frame) >= 0) {
                append(const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
                av_frame_unref(frame);
            }
        };

        // Decode loop
        while (av_read_frame(format_ctx, packet) >= 0) {
            if (packet->stream_index == audio_stream_idx) {
                if (avcodec_send_packet(codec_ctx, packet) >= 0) {
                    drain();
                }
            }
            av_packet_unref(packet);
        }

        // Flush decoder, then resampler
        avcodec_send_packet(codec_ctx, nullptr);
        drain();
        append(nullptr, 0);

        cleanup();

        if (buffer.samples.empty()) {
            return "No audio data decoded";
        }

        return buffer;
    }
};

Decoder::Decoder() : impl_(std::make_unique<Impl>()) {}
Decoder::~Decoder() = default;

Result<AudioInfo> Decoder::probe(const std::string& path) {
    return impl_->probe(path);
}

Result<AudioBuffer> Decoder::decode(const std::string& path, const DecodeOptions& options) {
    return impl_->decode(path, options);
}

} // namespace segue
