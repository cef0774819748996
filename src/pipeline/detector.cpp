#include "speech_guard/pipeline/detector.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

#include "speech_guard/errors.hpp"
#include "speech_guard/logging.hpp"
#include "speech_guard/metrics.hpp"
#include "speech_guard/utils/text.hpp"

namespace speech_guard {
namespace pipeline {

namespace {

using SteadyClock = std::chrono::steady_clock;

double seconds_since(SteadyClock::time_point start) {
    return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

std::string detected_message(double duration_sec) {
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer),
                  "Human speech detected in audio chunk (duration: %.2fs)", duration_sec);
    return buffer;
}

}

DetectorOptions DetectorOptions::from_config(const Config& config) {
    DetectorOptions options;
    options.sampling_rate = config.vad_sampling_rate;
    options.noise_suppression = config.noise_suppression;
    options.timeout = std::chrono::milliseconds(config.detection_timeout_ms);
    options.max_clip_seconds = config.max_clip_seconds;
    options.policy.min_segment_duration_sec = config.min_segment_duration_sec;
    options.policy.min_voiced_fraction = config.voicing_min_fraction;
    options.pitch.fmin_hz = config.voicing_fmin_hz;
    options.pitch.fmax_hz = config.voicing_fmax_hz;
    options.pitch.frame_length = static_cast<std::size_t>(config.pitch_frame_length());
    options.pitch.hop_length = options.pitch.frame_length / 4;
    if (config.vad_sampling_rate == 8000) {
        options.suppression.fft_size = 256;
        options.suppression.hop_size = 64;
    }
    return options;
}

SpeechDetector::SpeechDetector(DetectorOptions options,
                               std::shared_ptr<const vad::SpeechSegmenter> segmenter)
    : options_(options),
      segmenter_(std::move(segmenter)),
      decoder_(options.sampling_rate, options.max_clip_seconds),
      suppressor_(options.suppression),
      verifier_(options.sampling_rate, options.policy, options.pitch) {
    if (!segmenter_) {
        throw std::invalid_argument("SpeechDetector requires a segmenter");
    }
}

DetectionResult SpeechDetector::detect(const audio::AudioClip& clip) const {
    return detect(clip, Deadline::after(options_.timeout));
}

DetectionResult SpeechDetector::detect(const audio::AudioClip& clip,
                                       const Deadline& deadline) const {
    auto& metrics = Metrics::instance();
    const auto started = SteadyClock::now();
    try {
        auto result = run(clip, deadline);
        metrics.record_outcome(result.speech_detected ? "detected" : "not_detected");
        metrics.observe_detection_time(seconds_since(started));
        return result;
    } catch (const DecodeError& ex) {
        metrics.record_outcome("decode_error");
        logging::warn("Audio chunk could not be decoded",
                      {kv("mime_type", clip.mime_type), kv("bytes", clip.bytes.size()),
                       kv("error", ex.what())});
        throw;
    } catch (const ModelUnavailable& ex) {
        metrics.record_outcome("model_unavailable");
        logging::error("Speech detection model unavailable", {kv("error", ex.what())});
        throw;
    } catch (const TimeoutExceeded& ex) {
        metrics.record_outcome("timeout");
        logging::warn("Speech detection timed out", {kv("error", ex.what())});
        throw;
    } catch (const std::exception& ex) {
        metrics.record_outcome("error");
        logging::error("Speech detection failed", {kv("error", ex.what())});
        throw;
    }
}

audio::Waveform SpeechDetector::suppress_noise(audio::Waveform waveform,
                                               const Deadline& deadline) const {
    try {
        return suppressor_.process(waveform, deadline);
    } catch (const TimeoutExceeded&) {
        throw;
    } catch (const std::exception& ex) {
        Metrics::instance().increment_degraded();
        logging::warn("Noise suppression skipped", {kv("reason", ex.what())});
        return waveform;
    }
}

DetectionResult SpeechDetector::run(const audio::AudioClip& clip,
                                    const Deadline& deadline) const {
    auto& metrics = Metrics::instance();

    auto stage_start = SteadyClock::now();
    const auto pcm = decoder_.decode(clip, deadline);
    metrics.observe_stage_time("decode", seconds_since(stage_start));
    deadline.check("decode");

    stage_start = SteadyClock::now();
    auto waveform = decoder_.normalize(pcm, deadline);
    metrics.observe_stage_time("resample", seconds_since(stage_start));
    deadline.check("resample");

    if (options_.noise_suppression) {
        stage_start = SteadyClock::now();
        waveform = suppress_noise(std::move(waveform), deadline);
        metrics.observe_stage_time("denoise", seconds_since(stage_start));
        deadline.check("denoise");
    }

    stage_start = SteadyClock::now();
    const auto segments = segmenter_->segment(waveform, deadline);
    metrics.observe_stage_time("segment", seconds_since(stage_start));

    DetectionResult result;
    stage_start = SteadyClock::now();
    for (const auto& segment : segments) {
        deadline.check("verify");
        const auto verdict = verifier_.verify(segment, waveform);
        logging::debug("Candidate segment checked",
                       {kv("start", segment.start), kv("end", segment.end),
                        kv("duration", segment.duration_sec), kv("score", verdict.score),
                        kv("verdict", voicing::verdict_reason_name(verdict.reason))});
        if (verdict.admitted) {
            result.speech_detected = true;
            result.evidence = segment;
            result.voicing_score = verdict.score;
            break;
        }
    }
    metrics.observe_stage_time("verify", seconds_since(stage_start));

    result.timestamp = utils::iso8601_utc(std::chrono::system_clock::now());
    if (result.speech_detected) {
        result.message = detected_message(result.evidence->duration_sec);
        logging::info(result.message,
                      {kv("clip_sec", waveform.duration_sec()),
                       kv("segment_start", result.evidence->start),
                       kv("segment_end", result.evidence->end),
                       kv("voicing", result.voicing_score)});
    } else {
        result.message = "No human speech detected";
        logging::debug(result.message,
                       {kv("clip_sec", waveform.duration_sec()),
                        kv("candidates", segments.size())});
    }
    return result;
}

}
}
