#include "speech_guard/audio/waveform.hpp"

#include <algorithm>

namespace speech_guard {
namespace audio {

std::vector<float> downmix(const PcmBuffer& pcm) {
    if (pcm.channels <= 1) {
        return pcm.interleaved;
    }
    const std::size_t frames = pcm.frames();
    const auto channels = static_cast<std::size_t>(pcm.channels);
    std::vector<float> mono(frames);
    for (std::size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (std::size_t ch = 0; ch < channels; ++ch) {
            sum += pcm.interleaved[i * channels + ch];
        }
        mono[i] = std::clamp(sum / static_cast<float>(channels), -1.0f, 1.0f);
    }
    return mono;
}

}
}
