#pragma once

#include <string>

#include "speech_guard/audio/waveform.hpp"
#include "speech_guard/vad/segmenter.hpp"
#include "speech_guard/voicing/pitch.hpp"

namespace speech_guard {
namespace voicing {

struct VoicingPolicy {
    double min_segment_duration_sec = 0.3;
    double min_voiced_fraction = 0.15;
};

enum class VerdictReason {
    admitted,
    too_short,
    unvoiced,
    analysis_failed,
};

const char* verdict_reason_name(VerdictReason reason);

struct VoicingVerdict {
    bool admitted = false;
    double score = 0.0;
    VerdictReason reason = VerdictReason::unvoiced;
};

class VoicingVerifier {
public:
    VoicingVerifier(int sampling_rate, VoicingPolicy policy = {}, PitchParams pitch = {});

    double voicing_score(const vad::SpeechSegment& segment,
                         const audio::Waveform& waveform) const;

    VoicingVerdict verify(const vad::SpeechSegment& segment,
                          const audio::Waveform& waveform) const;

    const VoicingPolicy& policy() const { return policy_; }

private:
    VoicingPolicy policy_;
    PitchTracker tracker_;
};

}
}
