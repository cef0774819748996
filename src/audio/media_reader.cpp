#include "speech_guard/audio/media_reader.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "speech_guard/errors.hpp"
#include "speech_guard/logging.hpp"

namespace speech_guard {
namespace audio {

namespace {

constexpr int kAvioBufferSize = 4096;
constexpr std::size_t kResampleChunk = 16384;

struct MemorySource {
    const uint8_t* data;
    std::size_t size;
    std::size_t pos;
};

struct AvioDeleter {
    void operator()(AVIOContext* ctx) const {
        if (ctx) {
            av_freep(&ctx->buffer);
            avio_context_free(&ctx);
        }
    }
};

struct FormatDeleter {
    void operator()(AVFormatContext* ctx) const {
        avformat_close_input(&ctx);
    }
};

struct CodecDeleter {
    void operator()(AVCodecContext* ctx) const {
        avcodec_free_context(&ctx);
    }
};

struct PacketDeleter {
    void operator()(AVPacket* packet) const {
        av_packet_free(&packet);
    }
};

struct FrameDeleter {
    void operator()(AVFrame* frame) const {
        av_frame_free(&frame);
    }
};

struct SwrDeleter {
    void operator()(SwrContext* ctx) const {
        swr_free(&ctx);
    }
};

int read_packet(void* opaque, uint8_t* buf, int buf_size) {
    auto* source = static_cast<MemorySource*>(opaque);
    const std::size_t remaining = source->size - source->pos;
    if (remaining == 0) {
        return AVERROR_EOF;
    }
    const std::size_t count = std::min(static_cast<std::size_t>(buf_size), remaining);
    std::memcpy(buf, source->data + source->pos, count);
    source->pos += count;
    return static_cast<int>(count);
}

int64_t seek_packet(void* opaque, int64_t offset, int whence) {
    auto* source = static_cast<MemorySource*>(opaque);
    int64_t position = 0;
    switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET:
        position = offset;
        break;
    case SEEK_CUR:
        position = static_cast<int64_t>(source->pos) + offset;
        break;
    case SEEK_END:
        position = static_cast<int64_t>(source->size) + offset;
        break;
    case AVSEEK_SIZE:
        return static_cast<int64_t>(source->size);
    default:
        return AVERROR(EINVAL);
    }
    if (position < 0 || static_cast<std::size_t>(position) > source->size) {
        return AVERROR(EINVAL);
    }
    source->pos = static_cast<std::size_t>(position);
    return position;
}

int interrupt_on_deadline(void* opaque) {
    return static_cast<const Deadline*>(opaque)->expired() ? 1 : 0;
}

const char* demuxer_name(ContainerFormat format) {
    switch (format) {
    case ContainerFormat::webm:
        return "webm";
    case ContainerFormat::wav:
        return "wav";
    case ContainerFormat::mp3:
        return "mp3";
    case ContainerFormat::ogg:
        return "ogg";
    }
    return "webm";
}

std::string av_error_string(int code) {
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buffer, sizeof(buffer));
    return buffer;
}

void quiet_ffmpeg_logging() {
    static std::once_flag once;
    std::call_once(once, [] { av_log_set_level(AV_LOG_ERROR); });
}

float sample_at(const AVFrame* frame, AVSampleFormat fmt, int channel, int index, int channels) {
    const bool planar = av_sample_fmt_is_planar(fmt) != 0;
    const int plane = planar ? channel : 0;
    const int position = planar ? index : index * channels + channel;
    const uint8_t* data = frame->extended_data[plane];
    switch (av_get_packed_sample_fmt(fmt)) {
    case AV_SAMPLE_FMT_U8:
        return (static_cast<float>(data[position]) - 128.0f) / 127.0f;
    case AV_SAMPLE_FMT_S16:
        return static_cast<float>(reinterpret_cast<const int16_t*>(data)[position]) / 32767.0f;
    case AV_SAMPLE_FMT_S32:
        return static_cast<float>(
            static_cast<double>(reinterpret_cast<const int32_t*>(data)[position]) / 2147483647.0);
    case AV_SAMPLE_FMT_S64:
        return static_cast<float>(
            static_cast<double>(reinterpret_cast<const int64_t*>(data)[position]) /
            9223372036854775807.0);
    case AV_SAMPLE_FMT_FLT:
        return reinterpret_cast<const float*>(data)[position];
    case AV_SAMPLE_FMT_DBL:
        return static_cast<float>(reinterpret_cast<const double*>(data)[position]);
    default:
        throw DecodeError(std::string("unsupported decoder sample format ") +
                          av_get_sample_fmt_name(fmt));
    }
}

void append_frame(const AVFrame* frame, double max_seconds, PcmBuffer& pcm) {
    const int channels = frame->ch_layout.nb_channels;
    if (channels <= 0) {
        throw DecodeError("decoded frame has no channels");
    }
    if (pcm.channels == 0) {
        pcm.channels = channels;
        pcm.sample_rate = frame->sample_rate;
    } else if (pcm.channels != channels || pcm.sample_rate != frame->sample_rate) {
        throw DecodeError("stream changes channel layout or sample rate mid-clip");
    }
    if (pcm.sample_rate <= 0) {
        throw DecodeError("decoded frame has no sample rate");
    }
    const auto total_frames = pcm.frames() + static_cast<std::size_t>(frame->nb_samples);
    if (static_cast<double>(total_frames) / pcm.sample_rate > max_seconds) {
        throw DecodeError("clip longer than " + std::to_string(max_seconds) + " s");
    }
    const auto fmt = static_cast<AVSampleFormat>(frame->format);
    pcm.interleaved.reserve(pcm.interleaved.size() +
                            static_cast<std::size_t>(frame->nb_samples * channels));
    for (int i = 0; i < frame->nb_samples; ++i) {
        for (int ch = 0; ch < channels; ++ch) {
            const float value = sample_at(frame, fmt, ch, i, channels);
            if (!std::isfinite(value)) {
                throw DecodeError("decoder produced non-finite samples");
            }
            pcm.interleaved.push_back(std::clamp(value, -1.0f, 1.0f));
        }
    }
}

void drain_decoder(AVCodecContext* codec, AVFrame* frame, double max_seconds, PcmBuffer& pcm) {
    while (true) {
        const int ret = avcodec_receive_frame(codec, frame);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return;
        }
        if (ret < 0) {
            throw DecodeError("audio decoder failed: " + av_error_string(ret));
        }
        append_frame(frame, max_seconds, pcm);
        av_frame_unref(frame);
    }
}

void append_converted(SwrContext* swr, const uint8_t** input, int count, std::vector<float>& output) {
    const int capacity = swr_get_out_samples(swr, count);
    if (capacity < 0) {
        throw DecodeError("resampler failed: " + av_error_string(capacity));
    }
    if (capacity == 0) {
        return;
    }
    const std::size_t base = output.size();
    output.resize(base + static_cast<std::size_t>(capacity));
    auto* out = reinterpret_cast<uint8_t*>(output.data() + base);
    const int converted = swr_convert(swr, &out, capacity, input, count);
    if (converted < 0) {
        throw DecodeError("resampler failed: " + av_error_string(converted));
    }
    output.resize(base + static_cast<std::size_t>(converted));
}

}

PcmBuffer read_media(const std::string& bytes,
                     ContainerFormat format,
                     const Deadline& deadline,
                     double max_seconds) {
    quiet_ffmpeg_logging();

    MemorySource source{reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(), 0};
    auto* avio_buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
    if (!avio_buffer) {
        throw DecodeError("failed to allocate AVIO buffer");
    }
    std::unique_ptr<AVIOContext, AvioDeleter> avio(
        avio_alloc_context(avio_buffer, kAvioBufferSize, 0, &source, read_packet, nullptr,
                           seek_packet));
    if (!avio) {
        av_free(avio_buffer);
        throw DecodeError("failed to allocate AVIO context");
    }

    AVFormatContext* raw_format = avformat_alloc_context();
    if (!raw_format) {
        throw DecodeError("failed to allocate format context");
    }
    raw_format->pb = avio.get();
    raw_format->flags |= AVFMT_FLAG_CUSTOM_IO;
    raw_format->interrupt_callback.callback = interrupt_on_deadline;
    raw_format->interrupt_callback.opaque = const_cast<Deadline*>(&deadline);

    const AVInputFormat* input_format = av_find_input_format(demuxer_name(format));
    int ret = avformat_open_input(&raw_format, nullptr, input_format, nullptr);
    if (ret < 0) {
        deadline.check("demux");
        throw DecodeError(std::string("failed to open ") + container_name(format) +
                          " container: " + av_error_string(ret));
    }
    std::unique_ptr<AVFormatContext, FormatDeleter> format_ctx(raw_format);

    ret = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (ret < 0) {
        deadline.check("demux");
        throw DecodeError("failed to read stream info: " + av_error_string(ret));
    }

    const AVCodec* decoder = nullptr;
    const int stream_index =
        av_find_best_stream(format_ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &decoder, 0);
    if (stream_index == AVERROR_DECODER_NOT_FOUND) {
        throw DecodeError("unsupported audio codec");
    }
    if (stream_index < 0 || !decoder) {
        throw DecodeError("no audio stream found");
    }

    std::unique_ptr<AVCodecContext, CodecDeleter> codec(avcodec_alloc_context3(decoder));
    if (!codec) {
        throw DecodeError("failed to allocate codec context");
    }
    ret = avcodec_parameters_to_context(codec.get(),
                                        format_ctx->streams[stream_index]->codecpar);
    if (ret < 0) {
        throw DecodeError("failed to copy codec parameters: " + av_error_string(ret));
    }
    ret = avcodec_open2(codec.get(), decoder, nullptr);
    if (ret < 0) {
        throw DecodeError(std::string("failed to open ") + decoder->name + " decoder: " +
                          av_error_string(ret));
    }

    std::unique_ptr<AVPacket, PacketDeleter> packet(av_packet_alloc());
    std::unique_ptr<AVFrame, FrameDeleter> frame(av_frame_alloc());
    if (!packet || !frame) {
        throw DecodeError("failed to allocate packet/frame");
    }

    PcmBuffer pcm;
    int skipped_packets = 0;
    while ((ret = av_read_frame(format_ctx.get(), packet.get())) >= 0) {
        if (packet->stream_index == stream_index) {
            int sent = avcodec_send_packet(codec.get(), packet.get());
            if (sent == AVERROR(EAGAIN)) {
                drain_decoder(codec.get(), frame.get(), max_seconds, pcm);
                sent = avcodec_send_packet(codec.get(), packet.get());
            }
            if (sent == AVERROR_INVALIDDATA) {
                ++skipped_packets;
            } else if (sent < 0) {
                av_packet_unref(packet.get());
                throw DecodeError("audio decoder rejected packet: " + av_error_string(sent));
            }
            drain_decoder(codec.get(), frame.get(), max_seconds, pcm);
        }
        av_packet_unref(packet.get());
    }
    if (ret == AVERROR_EXIT) {
        deadline.check("demux");
    }
    if (ret != AVERROR_EOF) {
        throw DecodeError(std::string(container_name(format)) + " container truncated or corrupt: " +
                          av_error_string(ret));
    }

    ret = avcodec_send_packet(codec.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        throw DecodeError("failed to flush audio decoder: " + av_error_string(ret));
    }
    drain_decoder(codec.get(), frame.get(), max_seconds, pcm);

    if (skipped_packets > 0) {
        logging::debug("Skipped undecodable packets",
                       {kv("container", container_name(format)),
                        kv("packets", skipped_packets)});
    }
    if (pcm.interleaved.empty() || pcm.sample_rate <= 0) {
        throw DecodeError(std::string(container_name(format)) + " stream contains no audio frames");
    }
    return pcm;
}

std::vector<float> resample_mono(const std::vector<float>& input,
                                 int source_rate,
                                 int target_rate,
                                 const Deadline& deadline) {
    if (source_rate <= 0 || target_rate <= 0) {
        throw std::invalid_argument("sample rates must be positive");
    }
    if (source_rate == target_rate || input.empty()) {
        return input;
    }

    AVChannelLayout mono{};
    av_channel_layout_default(&mono, 1);
    SwrContext* raw_swr = nullptr;
    int ret = swr_alloc_set_opts2(&raw_swr, &mono, AV_SAMPLE_FMT_FLT, target_rate, &mono,
                                  AV_SAMPLE_FMT_FLT, source_rate, 0, nullptr);
    std::unique_ptr<SwrContext, SwrDeleter> swr(raw_swr);
    if (ret < 0 || !swr) {
        throw DecodeError("failed to configure resampler: " + av_error_string(ret));
    }
    ret = swr_init(swr.get());
    if (ret < 0) {
        throw DecodeError("failed to initialize resampler: " + av_error_string(ret));
    }

    const auto expected = static_cast<std::size_t>(
        (static_cast<long long>(input.size()) * target_rate + source_rate - 1) / source_rate);
    std::vector<float> output;
    output.reserve(expected + kResampleChunk);
    for (std::size_t offset = 0; offset < input.size(); offset += kResampleChunk) {
        deadline.check("resample");
        const auto count = std::min(kResampleChunk, input.size() - offset);
        const auto* samples = reinterpret_cast<const uint8_t*>(input.data() + offset);
        append_converted(swr.get(), &samples, static_cast<int>(count), output);
    }
    append_converted(swr.get(), nullptr, 0, output);

    output.resize(expected, 0.0f);
    for (auto& sample : output) {
        sample = std::clamp(sample, -1.0f, 1.0f);
    }
    return output;
}

}
}
