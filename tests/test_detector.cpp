#include <catch2/catch_test_macros.hpp>

#include "speech_guard/errors.hpp"
#include "speech_guard/metrics.hpp"
#include "speech_guard/pipeline/detector.hpp"
#include "speech_guard/vad/runtime.hpp"
#include "support/media.hpp"
#include "support/signals.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using speech_guard::Deadline;
using speech_guard::DecodeError;
using speech_guard::Metrics;
using speech_guard::ModelUnavailable;
using speech_guard::TimeoutExceeded;
using speech_guard::audio::AudioClip;
using speech_guard::pipeline::DetectorOptions;
using speech_guard::pipeline::SpeechDetector;

namespace {

std::shared_ptr<test_support::EnergySegmenter> energy_segmenter() {
    return std::make_shared<test_support::EnergySegmenter>();
}

AudioClip mono_wav(const std::vector<float>& samples, int rate) {
    return AudioClip{test_support::wav_bytes(samples, rate, 1), "audio/wav"};
}

}

TEST_CASE("SpeechDetector detects speech in a 44.1 kHz stereo recording") {
    const SpeechDetector detector(DetectorOptions{}, energy_segmenter());
    const auto stereo = test_support::to_stereo(test_support::harmonic_speech(44100, 2.0));
    const AudioClip clip{test_support::wav_bytes(stereo, 44100, 2), "audio/wav"};

    const auto result = detector.detect(clip);
    REQUIRE(result.speech_detected);
    REQUIRE(result.message.rfind("Human speech detected in audio chunk (duration: ", 0) == 0);
    REQUIRE(result.evidence.has_value());
    REQUIRE(result.evidence->duration_sec >= 0.3);
    REQUIRE(result.voicing_score > 0.15);
    REQUIRE(result.timestamp.back() == 'Z');
}

TEST_CASE("SpeechDetector detects speech in a lossy stereo 48 kHz MPEG clip") {
    const SpeechDetector detector(DetectorOptions{}, energy_segmenter());
    const auto stereo = test_support::to_stereo(test_support::harmonic_speech(48000, 2.0));
    const AudioClip clip{test_support::mp2_bytes(stereo, 48000, 2), "audio/mpeg"};
    REQUIRE(detector.detect(clip).speech_detected);
}

TEST_CASE("SpeechDetector rejects clips over the length limit as decode errors") {
    DetectorOptions options;
    options.max_clip_seconds = 1.0;
    const SpeechDetector detector(options, energy_segmenter());
    const auto clip = mono_wav(test_support::harmonic_speech(16000, 2.0), 16000);
    REQUIRE_THROWS_AS(detector.detect(clip), DecodeError);
}

TEST_CASE("SpeechDetector detects speech in mono 16 kHz PCM with background noise") {
    const SpeechDetector detector(DetectorOptions{}, energy_segmenter());
    const auto clip = mono_wav(test_support::harmonic_speech(16000, 1.5, 0.02), 16000);
    REQUIRE(detector.detect(clip).speech_detected);
}

TEST_CASE("SpeechDetector reports digital silence as no speech") {
    auto segmenter = energy_segmenter();
    const SpeechDetector detector(DetectorOptions{}, segmenter);
    const auto result = detector.detect(mono_wav(test_support::silence(16000, 2.0), 16000));
    REQUIRE_FALSE(result.speech_detected);
    REQUIRE(result.message == "No human speech detected");
    REQUIRE_FALSE(result.evidence.has_value());
    REQUIRE(segmenter->calls == 1);
}

TEST_CASE("SpeechDetector rejects impulsive non-vocal sounds that pass the segmenter") {
    auto segmenter = energy_segmenter();
    const auto knocks = test_support::clicks(16000, 2.0);
    const auto candidates =
        segmenter->segment(test_support::waveform(knocks, 16000), Deadline::unbounded());
    REQUIRE_FALSE(candidates.empty());

    const SpeechDetector detector(DetectorOptions{}, segmenter);
    REQUIRE_FALSE(detector.detect(mono_wav(knocks, 16000)).speech_detected);
}

TEST_CASE("SpeechDetector ignores voiced segments shorter than the minimum duration") {
    auto samples = test_support::silence(16000, 0.5);
    const auto vowel = test_support::steady_vowel(16000, 0.2);
    samples.insert(samples.end(), vowel.begin(), vowel.end());
    const auto tail = test_support::silence(16000, 0.8);
    samples.insert(samples.end(), tail.begin(), tail.end());

    const SpeechDetector detector(DetectorOptions{}, energy_segmenter());
    REQUIRE_FALSE(detector.detect(mono_wav(samples, 16000)).speech_detected);
}

TEST_CASE("SpeechDetector is idempotent on identical input") {
    const SpeechDetector detector(DetectorOptions{}, energy_segmenter());
    const auto clip = mono_wav(test_support::harmonic_speech(16000, 1.5), 16000);
    const auto first = detector.detect(clip);
    const auto second = detector.detect(clip);
    REQUIRE(first.speech_detected == second.speech_detected);
    REQUIRE(first.message == second.message);
    REQUIRE(first.evidence->start == second.evidence->start);
    REQUIRE(first.evidence->end == second.evidence->end);
    REQUIRE(first.voicing_score == second.voicing_score);
}

TEST_CASE("SpeechDetector surfaces decode failures") {
    const SpeechDetector detector(DetectorOptions{}, energy_segmenter());
    const auto before = Metrics::instance().outcome_count("decode_error");

    REQUIRE_THROWS_AS(detector.detect(AudioClip{"", "audio/webm"}), DecodeError);
    const auto wav = test_support::wav_bytes(test_support::harmonic_speech(16000, 1.0), 16000, 1);
    REQUIRE_THROWS_AS(detector.detect(AudioClip{wav.substr(0, wav.size() / 3), "audio/wav"}),
                      DecodeError);
    REQUIRE(Metrics::instance().outcome_count("decode_error") == before + 2);
}

TEST_CASE("SpeechDetector fails every call when the model failed to load") {
    auto runtime = std::make_shared<speech_guard::vad::ModelRuntime>(
        "/nonexistent/silero_vad.onnx", 16000, 1);
    REQUIRE_FALSE(runtime->init());
    auto segmenter = std::make_shared<speech_guard::vad::SileroSegmenter>(
        runtime, speech_guard::vad::SegmenterParams{});
    const SpeechDetector detector(DetectorOptions{}, segmenter);
    const auto before = Metrics::instance().outcome_count("model_unavailable");

    const auto speech = mono_wav(test_support::harmonic_speech(16000, 1.0), 16000);
    const auto quiet = mono_wav(test_support::silence(16000, 1.0), 16000);
    REQUIRE_THROWS_AS(detector.detect(speech), ModelUnavailable);
    REQUIRE_THROWS_AS(detector.detect(quiet), ModelUnavailable);
    REQUIRE(Metrics::instance().outcome_count("model_unavailable") == before + 2);
}

TEST_CASE("SpeechDetector enforces the detection budget") {
    const SpeechDetector detector(DetectorOptions{}, energy_segmenter());
    const auto clip = mono_wav(test_support::harmonic_speech(16000, 1.0), 16000);
    REQUIRE_THROWS_AS(detector.detect(clip, Deadline::after(std::chrono::milliseconds(0))),
                      TimeoutExceeded);
}

TEST_CASE("SpeechDetector continues without noise suppression when it degrades") {
    const SpeechDetector detector(DetectorOptions{}, energy_segmenter());
    const auto before = Metrics::instance().degraded_count();
    const auto result = detector.detect(mono_wav(std::vector<float>(300, 0.0f), 16000));
    REQUIRE_FALSE(result.speech_detected);
    REQUIRE(Metrics::instance().degraded_count() == before + 1);
}

TEST_CASE("SpeechDetector works with noise suppression disabled") {
    DetectorOptions options;
    options.noise_suppression = false;
    const SpeechDetector detector(options, energy_segmenter());
    const auto clip = mono_wav(test_support::harmonic_speech(16000, 1.5), 16000);
    REQUIRE(detector.detect(clip).speech_detected);
}

TEST_CASE("DetectorOptions::from_config carries the detection settings") {
    speech_guard::Config config;
    config.min_segment_duration_sec = 0.5;
    config.voicing_min_fraction = 0.3;
    config.noise_suppression = false;
    config.detection_timeout_ms = 1200;
    config.max_clip_seconds = 12.5;
    config.vad_sampling_rate = 8000;
    const auto options = DetectorOptions::from_config(config);
    REQUIRE(options.policy.min_segment_duration_sec == 0.5);
    REQUIRE(options.policy.min_voiced_fraction == 0.3);
    REQUIRE_FALSE(options.noise_suppression);
    REQUIRE(options.timeout == std::chrono::milliseconds(1200));
    REQUIRE(options.sampling_rate == 8000);
    REQUIRE(options.pitch.frame_length == 512);
    REQUIRE(options.pitch.hop_length == 128);
    REQUIRE(options.max_clip_seconds == 12.5);
}

TEST_CASE("SpeechDetector requires a segmenter") {
    REQUIRE_THROWS_AS(SpeechDetector(DetectorOptions{}, nullptr), std::invalid_argument);
}
