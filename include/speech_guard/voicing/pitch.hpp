#pragma once

#include <cstddef>
#include <vector>

namespace speech_guard {
namespace voicing {

struct PitchParams {
    double fmin_hz = 50.0;
    double fmax_hz = 400.0;
    std::size_t frame_length = 1024;
    std::size_t hop_length = 256;
    double aperiodicity_threshold = 0.2;
    double silence_rms = 1e-4;
    double max_jump_ratio = 1.2;
};

struct PitchFrame {
    double f0_hz = 0.0;
    double aperiodicity = 1.0;
    bool voiced = false;
};

class PitchTracker {
public:
    PitchTracker(int sampling_rate, PitchParams params = {});

    std::vector<PitchFrame> track(const float* samples, std::size_t count) const;

    int sampling_rate() const { return sampling_rate_; }
    const PitchParams& params() const { return params_; }

private:
    PitchFrame analyse_frame(const float* frame, std::vector<double>& diff) const;

    int sampling_rate_;
    PitchParams params_;
    std::size_t tau_min_;
    std::size_t tau_max_;
    std::size_t integration_window_;
};

}
}
