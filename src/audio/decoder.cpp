#include "speech_guard/audio/decoder.hpp"

#include <stdexcept>

#include "speech_guard/audio/media_reader.hpp"
#include "speech_guard/audio/wav_reader.hpp"
#include "speech_guard/errors.hpp"

namespace speech_guard {
namespace audio {

ClipDecoder::ClipDecoder(int target_rate, double max_clip_seconds)
    : target_rate_(target_rate), max_clip_seconds_(max_clip_seconds) {
    if (target_rate_ <= 0) {
        throw std::invalid_argument("target sample rate must be positive");
    }
    if (max_clip_seconds_ <= 0.0) {
        throw std::invalid_argument("clip length limit must be positive");
    }
}

PcmBuffer ClipDecoder::decode(const AudioClip& clip, const Deadline& deadline) const {
    if (clip.bytes.empty()) {
        throw DecodeError("audio payload is empty");
    }
    const auto format = container_from_mime(clip.mime_type);
    if (format == ContainerFormat::wav) {
        return read_wav(clip.bytes, max_clip_seconds_);
    }
    return read_media(clip.bytes, format, deadline, max_clip_seconds_);
}

Waveform ClipDecoder::normalize(const PcmBuffer& pcm, const Deadline& deadline) const {
    if (pcm.sample_rate <= 0 || pcm.channels <= 0 || pcm.frames() == 0) {
        throw DecodeError("decoded audio is empty");
    }
    Waveform waveform;
    waveform.sample_rate = target_rate_;
    waveform.samples = resample_mono(downmix(pcm), pcm.sample_rate, target_rate_, deadline);
    if (waveform.empty()) {
        throw DecodeError("decoded audio is empty after resampling");
    }
    return waveform;
}

}
}
