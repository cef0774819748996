#include "speech_guard/voicing/verifier.hpp"

#include <stdexcept>

#include "speech_guard/logging.hpp"

namespace speech_guard {
namespace voicing {

const char* verdict_reason_name(VerdictReason reason) {
    switch (reason) {
    case VerdictReason::admitted:
        return "admitted";
    case VerdictReason::too_short:
        return "too_short";
    case VerdictReason::unvoiced:
        return "unvoiced";
    case VerdictReason::analysis_failed:
        return "analysis_failed";
    }
    return "unknown";
}

VoicingVerifier::VoicingVerifier(int sampling_rate, VoicingPolicy policy, PitchParams pitch)
    : policy_(policy), tracker_(sampling_rate, pitch) {}

double VoicingVerifier::voicing_score(const vad::SpeechSegment& segment,
                                      const audio::Waveform& waveform) const {
    if (waveform.sample_rate != tracker_.sampling_rate()) {
        throw std::invalid_argument("waveform rate does not match the pitch tracker");
    }
    if (segment.start >= segment.end || segment.end > waveform.size()) {
        throw std::out_of_range("segment lies outside the waveform");
    }
    const auto frames = tracker_.track(waveform.samples.data() + segment.start,
                                       segment.end - segment.start);
    std::size_t voiced = 0;
    for (const auto& frame : frames) {
        if (frame.voiced) {
            ++voiced;
        }
    }
    return static_cast<double>(voiced) / static_cast<double>(frames.size());
}

VoicingVerdict VoicingVerifier::verify(const vad::SpeechSegment& segment,
                                       const audio::Waveform& waveform) const {
    VoicingVerdict verdict;
    if (segment.duration_sec < policy_.min_segment_duration_sec) {
        verdict.reason = VerdictReason::too_short;
        return verdict;
    }
    try {
        verdict.score = voicing_score(segment, waveform);
    } catch (const std::exception& ex) {
        logging::debug("Voicing analysis failed; rejecting segment",
                       {kv("start", segment.start), kv("end", segment.end),
                        kv("error", ex.what())});
        verdict.reason = VerdictReason::analysis_failed;
        return verdict;
    }
    verdict.admitted = verdict.score > policy_.min_voiced_fraction;
    verdict.reason = verdict.admitted ? VerdictReason::admitted : VerdictReason::unvoiced;
    return verdict;
}

}
}
