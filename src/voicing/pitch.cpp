#include "speech_guard/voicing/pitch.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace speech_guard {
namespace voicing {

PitchTracker::PitchTracker(int sampling_rate, PitchParams params)
    : sampling_rate_(sampling_rate), params_(params) {
    if (sampling_rate_ <= 0) {
        throw std::invalid_argument("pitch tracker needs a positive sampling rate");
    }
    if (params_.fmin_hz <= 0.0 || params_.fmax_hz <= params_.fmin_hz ||
        params_.fmax_hz * 2.0 > sampling_rate_) {
        throw std::invalid_argument("pitch range must satisfy 0 < fmin < fmax <= rate / 2");
    }
    if (params_.hop_length == 0) {
        throw std::invalid_argument("pitch hop length must be positive");
    }
    tau_min_ = std::max<std::size_t>(
        2, static_cast<std::size_t>(std::floor(sampling_rate_ / params_.fmax_hz)));
    tau_max_ = static_cast<std::size_t>(std::ceil(sampling_rate_ / params_.fmin_hz));
    if (tau_max_ + 2 >= params_.frame_length) {
        throw std::invalid_argument("pitch frame of " + std::to_string(params_.frame_length) +
                                    " samples cannot hold the lowest period");
    }
    integration_window_ = params_.frame_length - tau_max_ - 1;
}

PitchFrame PitchTracker::analyse_frame(const float* frame, std::vector<double>& diff) const {
    PitchFrame result;

    double energy = 0.0;
    for (std::size_t i = 0; i < params_.frame_length; ++i) {
        energy += static_cast<double>(frame[i]) * frame[i];
    }
    if (std::sqrt(energy / params_.frame_length) < params_.silence_rms) {
        return result;
    }

    // Difference function d(tau), then cumulative mean normalisation in place.
    diff[0] = 0.0;
    for (std::size_t tau = 1; tau <= tau_max_; ++tau) {
        double sum = 0.0;
        for (std::size_t j = 0; j < integration_window_; ++j) {
            const double delta = static_cast<double>(frame[j]) - frame[j + tau];
            sum += delta * delta;
        }
        diff[tau] = sum;
    }
    diff[0] = 1.0;
    double running = 0.0;
    for (std::size_t tau = 1; tau <= tau_max_; ++tau) {
        running += diff[tau];
        diff[tau] = running > 0.0 ? diff[tau] * static_cast<double>(tau) / running : 1.0;
    }

    std::size_t best = 0;
    for (std::size_t tau = tau_min_; tau < tau_max_; ++tau) {
        if (diff[tau] < params_.aperiodicity_threshold) {
            while (tau + 1 < tau_max_ && diff[tau + 1] < diff[tau]) {
                ++tau;
            }
            best = tau;
            break;
        }
    }
    if (best == 0) {
        result.aperiodicity =
            *std::min_element(diff.begin() + static_cast<std::ptrdiff_t>(tau_min_),
                              diff.begin() + static_cast<std::ptrdiff_t>(tau_max_));
        return result;
    }

    double refined = static_cast<double>(best);
    const double left = diff[best - 1];
    const double centre = diff[best];
    const double right = diff[best + 1];
    const double denom = left - 2.0 * centre + right;
    if (std::abs(denom) > 1e-12) {
        refined += std::clamp(0.5 * (left - right) / denom, -0.5, 0.5);
    }

    result.aperiodicity = centre;
    result.f0_hz = sampling_rate_ / refined;
    result.voiced = result.f0_hz >= params_.fmin_hz && result.f0_hz <= params_.fmax_hz;
    return result;
}

std::vector<PitchFrame> PitchTracker::track(const float* samples, std::size_t count) const {
    if (count < params_.frame_length) {
        throw std::domain_error("segment shorter than one pitch frame");
    }
    for (std::size_t i = 0; i < count; ++i) {
        if (!std::isfinite(samples[i])) {
            throw std::domain_error("segment contains non-finite samples");
        }
    }

    const std::size_t frame_count = 1 + (count - params_.frame_length) / params_.hop_length;
    std::vector<PitchFrame> frames;
    frames.reserve(frame_count);
    std::vector<double> diff(tau_max_ + 1, 0.0);
    for (std::size_t f = 0; f < frame_count; ++f) {
        frames.push_back(analyse_frame(samples + f * params_.hop_length, diff));
    }

    // Periodicity must persist: keep a voiced frame only when a neighbouring
    // voiced frame agrees on f0.
    auto agrees = [this](const PitchFrame& a, const PitchFrame& b) {
        if (!a.voiced || !b.voiced) {
            return false;
        }
        const double ratio = a.f0_hz > b.f0_hz ? a.f0_hz / b.f0_hz : b.f0_hz / a.f0_hz;
        return ratio <= params_.max_jump_ratio;
    };
    std::vector<bool> stable(frame_count, false);
    for (std::size_t f = 0; f < frame_count; ++f) {
        const bool with_prev = f > 0 && agrees(frames[f], frames[f - 1]);
        const bool with_next = f + 1 < frame_count && agrees(frames[f], frames[f + 1]);
        stable[f] = with_prev || with_next;
    }
    for (std::size_t f = 0; f < frame_count; ++f) {
        frames[f].voiced = stable[f];
        if (!stable[f]) {
            frames[f].f0_hz = 0.0;
        }
    }
    return frames;
}

}
}
