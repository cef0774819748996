#pragma once

#include <string>

#include "speech_guard/audio/waveform.hpp"

namespace speech_guard {
namespace audio {

PcmBuffer read_wav(const std::string& bytes, double max_seconds);

}
}
