#pragma once

#include "speech_guard/audio/clip.hpp"
#include "speech_guard/audio/waveform.hpp"
#include "speech_guard/deadline.hpp"

namespace speech_guard {
namespace audio {

class ClipDecoder {
public:
    explicit ClipDecoder(int target_rate, double max_clip_seconds = 30.0);

    PcmBuffer decode(const AudioClip& clip, const Deadline& deadline) const;

    Waveform normalize(const PcmBuffer& pcm, const Deadline& deadline) const;

    int target_rate() const { return target_rate_; }
    double max_clip_seconds() const { return max_clip_seconds_; }

private:
    int target_rate_;
    double max_clip_seconds_;
};

}
}
