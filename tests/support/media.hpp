#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
}

namespace test_support {

struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};

struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

struct PacketDeleter {
    void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};

inline void collect_packets(AVCodecContext* ctx, AVPacket* packet, std::string& out) {
    while (true) {
        const int ret = avcodec_receive_packet(ctx, packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return;
        }
        if (ret < 0) {
            throw std::runtime_error("MP2 encoder failed");
        }
        out.append(reinterpret_cast<const char*>(packet->data), static_cast<std::size_t>(packet->size));
        av_packet_unref(packet);
    }
}

// MPEG-1 Layer II elementary stream from interleaved float samples. Layer II
// frames are self-synchronising, so the raw stream is a valid audio/mpeg clip.
inline std::string mp2_bytes(const std::vector<float>& interleaved, int rate, int channels) {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MP2);
    if (!codec) {
        throw std::runtime_error("libavcodec was built without the MP2 encoder");
    }
    std::unique_ptr<AVCodecContext, CodecContextDeleter> ctx(avcodec_alloc_context3(codec));
    if (!ctx) {
        throw std::runtime_error("failed to allocate MP2 encoder");
    }
    ctx->sample_fmt = AV_SAMPLE_FMT_S16;
    ctx->sample_rate = rate;
    ctx->bit_rate = 192000;
    av_channel_layout_default(&ctx->ch_layout, channels);
    if (avcodec_open2(ctx.get(), codec, nullptr) < 0) {
        throw std::runtime_error("failed to open MP2 encoder");
    }

    std::unique_ptr<AVFrame, FrameDeleter> frame(av_frame_alloc());
    std::unique_ptr<AVPacket, PacketDeleter> packet(av_packet_alloc());
    frame->nb_samples = ctx->frame_size;
    frame->format = ctx->sample_fmt;
    frame->sample_rate = rate;
    if (av_channel_layout_copy(&frame->ch_layout, &ctx->ch_layout) < 0 ||
        av_frame_get_buffer(frame.get(), 0) < 0) {
        throw std::runtime_error("failed to allocate MP2 frame");
    }

    std::string out;
    const auto total = interleaved.size() / static_cast<std::size_t>(channels);
    const auto frame_size = static_cast<std::size_t>(ctx->frame_size);
    for (std::size_t start = 0; start < total; start += frame_size) {
        if (av_frame_make_writable(frame.get()) < 0) {
            throw std::runtime_error("MP2 frame is not writable");
        }
        auto* samples = reinterpret_cast<int16_t*>(frame->data[0]);
        for (std::size_t i = 0; i < frame_size * static_cast<std::size_t>(channels); ++i) {
            const std::size_t index = start * static_cast<std::size_t>(channels) + i;
            const double value = index < interleaved.size() ? interleaved[index] : 0.0;
            samples[i] = static_cast<int16_t>(std::lround(std::clamp(value, -1.0, 1.0) * 32767.0));
        }
        frame->pts = static_cast<int64_t>(start);
        if (avcodec_send_frame(ctx.get(), frame.get()) < 0) {
            throw std::runtime_error("MP2 encoder rejected a frame");
        }
        collect_packets(ctx.get(), packet.get(), out);
    }
    if (avcodec_send_frame(ctx.get(), nullptr) < 0) {
        throw std::runtime_error("failed to flush MP2 encoder");
    }
    collect_packets(ctx.get(), packet.get(), out);
    return out;
}

}
