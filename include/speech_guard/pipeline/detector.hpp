#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "speech_guard/audio/clip.hpp"
#include "speech_guard/audio/decoder.hpp"
#include "speech_guard/config.hpp"
#include "speech_guard/deadline.hpp"
#include "speech_guard/denoise/noise_suppressor.hpp"
#include "speech_guard/vad/segmenter.hpp"
#include "speech_guard/voicing/verifier.hpp"

namespace speech_guard {
namespace pipeline {

struct DetectionResult {
    bool speech_detected = false;
    std::string message;
    std::string timestamp;
    std::optional<vad::SpeechSegment> evidence;
    double voicing_score = 0.0;
};

struct DetectorOptions {
    int sampling_rate = 16000;
    bool noise_suppression = true;
    std::chrono::milliseconds timeout{5000};
    double max_clip_seconds = 30.0;
    voicing::VoicingPolicy policy;
    voicing::PitchParams pitch;
    denoise::NoiseSuppressorConfig suppression;

    static DetectorOptions from_config(const Config& config);
};

class SpeechDetector {
public:
    SpeechDetector(DetectorOptions options, std::shared_ptr<const vad::SpeechSegmenter> segmenter);

    DetectionResult detect(const audio::AudioClip& clip) const;
    DetectionResult detect(const audio::AudioClip& clip, const Deadline& deadline) const;

    const DetectorOptions& options() const { return options_; }

private:
    DetectionResult run(const audio::AudioClip& clip, const Deadline& deadline) const;
    audio::Waveform suppress_noise(audio::Waveform waveform, const Deadline& deadline) const;

    DetectorOptions options_;
    std::shared_ptr<const vad::SpeechSegmenter> segmenter_;
    audio::ClipDecoder decoder_;
    denoise::NoiseSuppressor suppressor_;
    voicing::VoicingVerifier verifier_;
};

}
}
