#include "speech_guard/dsp/fft.hpp"

#include <cmath>
#include <stdexcept>

#include <kiss_fftr.h>

namespace speech_guard::dsp {

namespace {

constexpr double kPi = 3.14159265358979323846;

static_assert(sizeof(kiss_fft_cpx) == sizeof(std::complex<float>),
              "kissfft must be built with float scalars");

}

bool is_power_of_two(std::size_t value) {
    return value != 0 && (value & (value - 1)) == 0;
}

RealFft::RealFft(std::size_t size)
    : size_(size), forward_(nullptr), inverse_(nullptr) {
    if (!is_power_of_two(size_) || size_ < 4) {
        throw std::invalid_argument("FFT size must be a power of two of at least 4");
    }
    forward_ = kiss_fftr_alloc(static_cast<int>(size_), 0, nullptr, nullptr);
    inverse_ = kiss_fftr_alloc(static_cast<int>(size_), 1, nullptr, nullptr);
    if (!forward_ || !inverse_) {
        kiss_fftr_free(forward_);
        kiss_fftr_free(inverse_);
        throw std::runtime_error("failed to allocate kissfft plan");
    }
}

RealFft::~RealFft() {
    kiss_fftr_free(forward_);
    kiss_fftr_free(inverse_);
}

void RealFft::forward(const std::vector<float>& frame, std::vector<std::complex<float>>& spectrum) {
    if (frame.size() != size_) {
        throw std::invalid_argument("FFT input does not match the plan size");
    }
    spectrum.resize(bins());
    kiss_fftr(forward_, frame.data(), reinterpret_cast<kiss_fft_cpx*>(spectrum.data()));
}

void RealFft::inverse(const std::vector<std::complex<float>>& spectrum, std::vector<float>& frame) {
    if (spectrum.size() != bins()) {
        throw std::invalid_argument("FFT spectrum does not match the plan size");
    }
    frame.resize(size_);
    kiss_fftri(inverse_, reinterpret_cast<const kiss_fft_cpx*>(spectrum.data()), frame.data());
    const float scale = 1.0f / static_cast<float>(size_);
    for (auto& value : frame) {
        value *= scale;
    }
}

std::vector<float> hann_window(std::size_t size) {
    std::vector<float> window(size);
    for (std::size_t i = 0; i < size; ++i) {
        window[i] = static_cast<float>(
            0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(size)));
    }
    return window;
}

}
