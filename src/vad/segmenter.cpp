#include "speech_guard/vad/segmenter.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "speech_guard/logging.hpp"
#include "speech_guard/vad/model.hpp"
#include "speech_guard/vad/runtime.hpp"

namespace speech_guard {
namespace vad {

namespace {

std::size_t window_for(int sampling_rate) {
    return sampling_rate == 16000 ? 512 : 256;
}

std::size_t context_for(int sampling_rate) {
    return sampling_rate == 16000 ? 64 : 32;
}

}

std::vector<SpeechSegment> collect_segments(const std::vector<float>& probs,
                                            std::size_t window_size,
                                            std::size_t total_samples,
                                            int sampling_rate,
                                            const SegmenterParams& params) {
    if (sampling_rate <= 0 || window_size == 0) {
        throw std::invalid_argument("segmenter needs a positive rate and window size");
    }
    const std::size_t min_speech_samples =
        static_cast<std::size_t>(sampling_rate) * params.min_speech_duration_ms / 1000;
    const std::size_t min_silence_samples =
        static_cast<std::size_t>(sampling_rate) * params.min_silence_duration_ms / 1000;
    const std::size_t pad_samples =
        static_cast<std::size_t>(sampling_rate) * params.speech_pad_ms / 1000;
    const float neg_threshold = std::max(params.threshold - 0.15f, 0.01f);

    std::vector<SpeechSegment> segments;
    bool triggered = false;
    std::size_t start = 0;
    std::size_t temp_end = 0;

    for (std::size_t i = 0; i < probs.size(); ++i) {
        const float prob = probs[i];
        const std::size_t position = i * window_size;
        if (prob >= params.threshold && temp_end != 0) {
            temp_end = 0;
        }
        if (prob >= params.threshold && !triggered) {
            triggered = true;
            start = position;
            continue;
        }
        if (prob < neg_threshold && triggered) {
            if (temp_end == 0) {
                temp_end = position;
            }
            if (position - temp_end < min_silence_samples) {
                continue;
            }
            if (temp_end - start > min_speech_samples) {
                segments.push_back({start, temp_end, 0.0});
            }
            triggered = false;
            temp_end = 0;
        }
    }
    if (triggered && total_samples > start && total_samples - start > min_speech_samples) {
        segments.push_back({start, total_samples, 0.0});
    }

    for (std::size_t i = 0; i < segments.size(); ++i) {
        auto& current = segments[i];
        if (i == 0) {
            current.start = current.start > pad_samples ? current.start - pad_samples : 0;
        }
        if (i + 1 < segments.size()) {
            auto& next = segments[i + 1];
            const std::size_t silence = next.start - current.end;
            if (silence < 2 * pad_samples) {
                current.end += silence / 2;
                next.start -= silence / 2;
            } else {
                current.end = std::min(total_samples, current.end + pad_samples);
                next.start = next.start > pad_samples ? next.start - pad_samples : 0;
            }
        } else {
            current.end = std::min(total_samples, current.end + pad_samples);
        }
    }
    for (auto& segment : segments) {
        segment.duration_sec =
            static_cast<double>(segment.end - segment.start) / sampling_rate;
    }
    return segments;
}

SileroSegmenter::SileroSegmenter(std::shared_ptr<ModelRuntime> runtime, SegmenterParams params)
    : runtime_(std::move(runtime)), params_(params) {
    if (!runtime_) {
        throw std::invalid_argument("SileroSegmenter requires a model runtime");
    }
}

std::vector<SpeechSegment> SileroSegmenter::segment(const audio::Waveform& waveform,
                                                    const Deadline& deadline) const {
    if (waveform.sample_rate != runtime_->sampling_rate()) {
        throw std::invalid_argument("waveform rate " + std::to_string(waveform.sample_rate) +
                                    " does not match VAD rate " +
                                    std::to_string(runtime_->sampling_rate()));
    }
    const std::size_t window = window_for(waveform.sample_rate);
    const std::size_t context = context_for(waveform.sample_rate);

    auto lease = runtime_->acquire(deadline);
    const VadSession& model = lease.model();
    auto state = model.initialize_state();

    std::vector<float> probs;
    probs.reserve(waveform.size() / window + 1);
    std::vector<float> input(context + window, 0.0f);
    for (std::size_t offset = 0; offset < waveform.size(); offset += window) {
        deadline.check("segment");
        const std::size_t count = std::min(window, waveform.size() - offset);
        std::copy(waveform.samples.begin() + static_cast<std::ptrdiff_t>(offset),
                  waveform.samples.begin() + static_cast<std::ptrdiff_t>(offset + count),
                  input.begin() + static_cast<std::ptrdiff_t>(context));
        std::fill(input.begin() + static_cast<std::ptrdiff_t>(context + count), input.end(),
                  0.0f);
        probs.push_back(model.get_speech_prob(input, &state));
        std::copy(input.end() - static_cast<std::ptrdiff_t>(context), input.end(),
                  input.begin());
    }

    auto segments = collect_segments(probs, window, waveform.size(), waveform.sample_rate,
                                     params_);
    logging::debug("VAD segmentation finished",
                   {kv("windows", probs.size()), kv("segments", segments.size())});
    return segments;
}

}
}
