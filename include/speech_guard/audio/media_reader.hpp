#pragma once

#include <string>
#include <vector>

#include "speech_guard/audio/clip.hpp"
#include "speech_guard/audio/waveform.hpp"
#include "speech_guard/deadline.hpp"

namespace speech_guard {
namespace audio {

PcmBuffer read_media(const std::string& bytes,
                     ContainerFormat format,
                     const Deadline& deadline,
                     double max_seconds);

std::vector<float> resample_mono(const std::vector<float>& input,
                                 int source_rate,
                                 int target_rate,
                                 const Deadline& deadline);

}
}
