#pragma once

#include <string>

namespace speech_guard {
namespace audio {

enum class ContainerFormat {
    webm,
    wav,
    mp3,
    ogg,
};

struct AudioClip {
    std::string bytes;
    std::string mime_type;
};

ContainerFormat container_from_mime(const std::string& mime_type);
const char* container_name(ContainerFormat format);

}
}
