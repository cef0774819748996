#include "speech_guard/denoise/noise_suppressor.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "speech_guard/dsp/fft.hpp"
#include "speech_guard/errors.hpp"
#include "speech_guard/logging.hpp"

namespace speech_guard {
namespace denoise {

namespace {

using Spectrum = std::vector<std::complex<float>>;

struct FrameStats {
    double energy = 0.0;
    double flatness = 0.0;
};

class FrameAnalyser {
public:
    FrameAnalyser(const std::vector<float>& padded, std::size_t n_fft)
        : padded_(padded), window_(dsp::hann_window(n_fft)), fft_(n_fft), frame_(n_fft) {}

    const Spectrum& transform(std::size_t offset) {
        for (std::size_t i = 0; i < frame_.size(); ++i) {
            frame_[i] = padded_[offset + i] * window_[i];
        }
        fft_.forward(frame_, spectrum_);
        return spectrum_;
    }

    FrameStats stats(std::size_t offset) {
        const auto& spectrum = transform(offset);
        const std::size_t bins = spectrum.size();
        FrameStats result;
        double log_sum = 0.0;
        for (std::size_t k = 1; k + 1 < bins; ++k) {
            result.energy += std::norm(spectrum[k]);
        }
        const double inner = static_cast<double>(bins - 2);
        const double mean_power = result.energy / inner;
        if (mean_power <= 0.0) {
            return result;
        }
        const double eps = mean_power * 1e-12;
        for (std::size_t k = 1; k + 1 < bins; ++k) {
            log_sum += std::log(std::norm(spectrum[k]) + eps);
        }
        result.flatness = std::exp(log_sum / inner) / mean_power;
        return result;
    }

    void synthesize(Spectrum& spectrum, std::size_t offset, std::vector<float>& output,
                    std::vector<float>& weight) {
        fft_.inverse(spectrum, frame_);
        for (std::size_t i = 0; i < frame_.size(); ++i) {
            output[offset + i] += frame_[i] * window_[i];
            weight[offset + i] += window_[i] * window_[i];
        }
    }

private:
    const std::vector<float>& padded_;
    std::vector<float> window_;
    dsp::RealFft fft_;
    std::vector<float> frame_;
    Spectrum spectrum_;
};

}

NoiseSuppressor::NoiseSuppressor(NoiseSuppressorConfig cfg) : cfg_(cfg) {
    if (cfg_.fft_size < 4 || !dsp::is_power_of_two(static_cast<std::size_t>(cfg_.fft_size))) {
        throw std::invalid_argument("noise suppressor FFT size must be a power of two");
    }
    if (cfg_.hop_size <= 0 || cfg_.hop_size > cfg_.fft_size / 2) {
        throw std::invalid_argument("noise suppressor hop must be in (0, fft_size / 2]");
    }
    if (cfg_.noise_frame_fraction <= 0.0 || cfg_.noise_frame_fraction > 1.0) {
        throw std::invalid_argument("noise frame fraction must be in (0, 1]");
    }
}

audio::Waveform NoiseSuppressor::process(const audio::Waveform& input,
                                         const Deadline& deadline) const {
    const auto n_fft = static_cast<std::size_t>(cfg_.fft_size);
    const auto hop = static_cast<std::size_t>(cfg_.hop_size);
    const std::size_t length = input.size();

    if (length < n_fft) {
        throw StageDegraded("clip shorter than one noise analysis window");
    }
    for (float sample : input.samples) {
        if (!std::isfinite(sample)) {
            throw StageDegraded("clip contains non-finite samples");
        }
    }

    // A full window of left padding gives every sample the same frame count.
    const std::size_t pad = n_fft;
    const std::size_t frame_count = (length + pad - 1) / hop + 1;
    std::vector<float> padded(pad + frame_count * hop + n_fft, 0.0f);
    std::copy(input.samples.begin(), input.samples.end(),
              padded.begin() + static_cast<std::ptrdiff_t>(pad));

    FrameAnalyser analyser(padded, n_fft);

    std::vector<std::size_t> interior;
    std::vector<FrameStats> stats;
    for (std::size_t f = 0; f < frame_count; ++f) {
        const std::size_t offset = f * hop;
        if (offset >= pad && offset + n_fft <= pad + length) {
            deadline.check("denoise");
            interior.push_back(offset);
            stats.push_back(analyser.stats(offset));
        }
    }
    if (interior.empty()) {
        throw StageDegraded("no complete analysis frame for noise estimation");
    }

    std::vector<std::size_t> order(interior.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&stats](std::size_t a, std::size_t b) {
        return stats[a].energy < stats[b].energy;
    });
    const auto quiet_count = std::max<std::size_t>(
        1, static_cast<std::size_t>(cfg_.noise_frame_fraction * static_cast<double>(order.size())));
    const double median_energy = stats[order[order.size() / 2]].energy;
    if (median_energy <= 0.0) {
        return input;
    }

    double quiet_energy = 0.0;
    double quiet_flatness = 0.0;
    for (std::size_t i = 0; i < quiet_count; ++i) {
        quiet_energy += stats[order[i]].energy;
        quiet_flatness += stats[order[i]].flatness;
    }
    quiet_energy /= static_cast<double>(quiet_count);
    quiet_flatness /= static_cast<double>(quiet_count);

    const bool flat = quiet_flatness >= cfg_.min_noise_flatness;
    const bool far_below = quiet_energy * cfg_.min_noise_contrast <= median_energy;
    if (!flat && !far_below) {
        logging::debug("No noise-only frames found; suppression skipped",
                       {kv("flatness", quiet_flatness),
                        kv("contrast", median_energy / quiet_energy)});
        return input;
    }

    std::vector<float> noise(n_fft / 2 + 1, 0.0f);
    for (std::size_t i = 0; i < quiet_count; ++i) {
        deadline.check("denoise");
        const auto& spectrum = analyser.transform(interior[order[i]]);
        for (std::size_t k = 0; k < noise.size(); ++k) {
            noise[k] += std::abs(spectrum[k]);
        }
    }
    for (auto& value : noise) {
        value /= static_cast<float>(quiet_count);
    }

    const auto alpha = static_cast<float>(cfg_.over_subtraction);
    const auto beta = static_cast<float>(cfg_.spectral_floor);
    std::vector<float> output(padded.size(), 0.0f);
    std::vector<float> weight(padded.size(), 0.0f);
    Spectrum spectrum;
    for (std::size_t f = 0; f < frame_count; ++f) {
        deadline.check("denoise");
        const std::size_t offset = f * hop;
        spectrum = analyser.transform(offset);
        for (std::size_t k = 0; k < spectrum.size(); ++k) {
            const float magnitude = std::abs(spectrum[k]);
            if (magnitude > 0.0f) {
                spectrum[k] *= std::max(magnitude - alpha * noise[k], beta * magnitude) / magnitude;
            }
        }
        analyser.synthesize(spectrum, offset, output, weight);
    }

    audio::Waveform result;
    result.sample_rate = input.sample_rate;
    result.samples.resize(length);
    for (std::size_t i = 0; i < length; ++i) {
        const float w = weight[pad + i];
        const float value = w > 1e-6f ? output[pad + i] / w : 0.0f;
        if (!std::isfinite(value)) {
            throw StageDegraded("noise suppression produced non-finite output");
        }
        result.samples[i] = std::clamp(value, -1.0f, 1.0f);
    }
    return result;
}

}
}
