#pragma once

#include "speech_guard/audio/waveform.hpp"
#include "speech_guard/deadline.hpp"

namespace speech_guard {
namespace denoise {

struct NoiseSuppressorConfig {
    int fft_size = 512;
    int hop_size = 128;
    double noise_frame_fraction = 0.2;
    double min_noise_flatness = 0.25;
    double min_noise_contrast = 30.0;
    double over_subtraction = 2.0;
    double spectral_floor = 0.05;
};

class NoiseSuppressor {
public:
    explicit NoiseSuppressor(NoiseSuppressorConfig cfg = {});

    audio::Waveform process(const audio::Waveform& input,
                            const Deadline& deadline = Deadline::unbounded()) const;

private:
    NoiseSuppressorConfig cfg_;
};

}
}
