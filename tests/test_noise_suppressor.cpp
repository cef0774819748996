#include <catch2/catch_test_macros.hpp>

#include "speech_guard/denoise/noise_suppressor.hpp"
#include "speech_guard/errors.hpp"
#include "support/signals.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

using speech_guard::StageDegraded;
using speech_guard::denoise::NoiseSuppressor;
using speech_guard::denoise::NoiseSuppressorConfig;

namespace {

double energy(const std::vector<float>& samples) {
    double sum = 0.0;
    for (float sample : samples) {
        sum += static_cast<double>(sample) * sample;
    }
    return sum;
}

}

TEST_CASE("NoiseSuppressor keeps length and rate") {
    const NoiseSuppressor suppressor;
    const auto input = test_support::waveform(test_support::harmonic_speech(16000, 1.0), 16000);
    const auto output = suppressor.process(input);
    REQUIRE(output.sample_rate == 16000);
    REQUIRE(output.size() == input.size());
}

TEST_CASE("NoiseSuppressor attenuates stationary noise") {
    const NoiseSuppressor suppressor;
    const auto input = test_support::waveform(test_support::white_noise(16000, 1.0, 0.05), 16000);
    const auto output = suppressor.process(input);
    REQUIRE(energy(output.samples) < 0.5 * energy(input.samples));
}

TEST_CASE("NoiseSuppressor preserves most of a voiced signal over a noise floor") {
    const NoiseSuppressor suppressor;
    const auto input =
        test_support::waveform(test_support::harmonic_speech(16000, 1.5, 0.005), 16000);
    const auto output = suppressor.process(input);
    REQUIRE(energy(output.samples) > 0.5 * energy(input.samples));
}

TEST_CASE("NoiseSuppressor keeps voicing that fills the whole clip") {
    const NoiseSuppressor suppressor;

    const auto vowel = test_support::waveform(test_support::steady_vowel(16000, 2.0), 16000);
    REQUIRE(energy(suppressor.process(vowel).samples) > 0.9 * energy(vowel.samples));

    const auto talk = test_support::waveform(
        test_support::harmonic_speech(16000, 2.0, 0.005, 7, 0.2, 0.0), 16000);
    REQUIRE(energy(suppressor.process(talk).samples) > 0.9 * energy(talk.samples));
}

TEST_CASE("NoiseSuppressor stops at the deadline") {
    const NoiseSuppressor suppressor;
    const auto input = test_support::waveform(test_support::white_noise(16000, 1.0, 0.05), 16000);
    const auto deadline = speech_guard::Deadline::after(std::chrono::milliseconds(0));
    REQUIRE_THROWS_AS(suppressor.process(input, deadline), speech_guard::TimeoutExceeded);
}

TEST_CASE("NoiseSuppressor leaves digital silence silent") {
    const NoiseSuppressor suppressor;
    const auto output =
        suppressor.process(test_support::waveform(test_support::silence(16000, 0.5), 16000));
    REQUIRE(energy(output.samples) == 0.0);
}

TEST_CASE("NoiseSuppressor degrades on clips it cannot analyse") {
    const NoiseSuppressor suppressor;
    REQUIRE_THROWS_AS(
        suppressor.process(test_support::waveform(std::vector<float>(100, 0.1f), 16000)),
        StageDegraded);

    auto samples = test_support::white_noise(16000, 0.5, 0.1);
    samples[1000] = std::numeric_limits<float>::quiet_NaN();
    REQUIRE_THROWS_AS(suppressor.process(test_support::waveform(samples, 16000)), StageDegraded);
}

TEST_CASE("NoiseSuppressor rejects invalid analysis settings") {
    NoiseSuppressorConfig cfg;
    cfg.fft_size = 500;
    REQUIRE_THROWS_AS(NoiseSuppressor(cfg), std::invalid_argument);
    cfg = NoiseSuppressorConfig{};
    cfg.hop_size = 0;
    REQUIRE_THROWS_AS(NoiseSuppressor(cfg), std::invalid_argument);
    cfg = NoiseSuppressorConfig{};
    cfg.noise_frame_fraction = 0.0;
    REQUIRE_THROWS_AS(NoiseSuppressor(cfg), std::invalid_argument);
}
