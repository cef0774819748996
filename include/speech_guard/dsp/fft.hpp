#pragma once

#include <complex>
#include <cstddef>
#include <vector>

struct kiss_fftr_state;

namespace speech_guard::dsp {

bool is_power_of_two(std::size_t value);

class RealFft {
public:
    explicit RealFft(std::size_t size);
    ~RealFft();

    RealFft(const RealFft&) = delete;
    RealFft& operator=(const RealFft&) = delete;

    std::size_t size() const { return size_; }
    std::size_t bins() const { return size_ / 2 + 1; }

    void forward(const std::vector<float>& frame, std::vector<std::complex<float>>& spectrum);
    // Scaled by 1 / size.
    void inverse(const std::vector<std::complex<float>>& spectrum, std::vector<float>& frame);

private:
    std::size_t size_;
    kiss_fftr_state* forward_;
    kiss_fftr_state* inverse_;
};

std::vector<float> hann_window(std::size_t size);

}
