#pragma once

#include <cstddef>
#include <vector>

namespace speech_guard {
namespace audio {

struct PcmBuffer {
    std::vector<float> interleaved;
    int sample_rate = 0;
    int channels = 0;

    std::size_t frames() const {
        return channels > 0 ? interleaved.size() / static_cast<std::size_t>(channels) : 0;
    }
};

struct Waveform {
    std::vector<float> samples;
    int sample_rate = 0;

    bool empty() const { return samples.empty(); }
    std::size_t size() const { return samples.size(); }
    double duration_sec() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

std::vector<float> downmix(const PcmBuffer& pcm);

}
}
