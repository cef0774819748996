#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "speech_guard/audio/waveform.hpp"
#include "speech_guard/deadline.hpp"

namespace speech_guard {
namespace vad {

class ModelRuntime;

struct SpeechSegment {
    std::size_t start = 0;
    std::size_t end = 0;
    double duration_sec = 0.0;
};

struct SegmenterParams {
    float threshold = 0.5f;
    int min_speech_duration_ms = 250;
    int min_silence_duration_ms = 100;
    int speech_pad_ms = 30;
};

// Turns per-window speech probabilities into padded speech spans. Window i
// covers samples [i * window, (i + 1) * window).
std::vector<SpeechSegment> collect_segments(const std::vector<float>& probs,
                                            std::size_t window_size,
                                            std::size_t total_samples,
                                            int sampling_rate,
                                            const SegmenterParams& params);

class SpeechSegmenter {
public:
    virtual ~SpeechSegmenter() = default;

    virtual std::vector<SpeechSegment> segment(const audio::Waveform& waveform,
                                               const Deadline& deadline) const = 0;
};

class SileroSegmenter : public SpeechSegmenter {
public:
    SileroSegmenter(std::shared_ptr<ModelRuntime> runtime, SegmenterParams params);

    std::vector<SpeechSegment> segment(const audio::Waveform& waveform,
                                       const Deadline& deadline) const override;

private:
    std::shared_ptr<ModelRuntime> runtime_;
    SegmenterParams params_;
};

}
}
