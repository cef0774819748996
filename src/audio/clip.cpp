#include "speech_guard/audio/clip.hpp"

#include "speech_guard/utils/text.hpp"

namespace speech_guard {
namespace audio {

ContainerFormat container_from_mime(const std::string& mime_type) {
    const auto mime = utils::mime_essence(mime_type);
    if (mime.find("webm") != std::string::npos) {
        return ContainerFormat::webm;
    }
    if (mime.find("wav") != std::string::npos) {
        return ContainerFormat::wav;
    }
    if (mime.find("mp3") != std::string::npos || mime.find("mpeg") != std::string::npos) {
        return ContainerFormat::mp3;
    }
    if (mime.find("ogg") != std::string::npos || mime.find("opus") != std::string::npos) {
        return ContainerFormat::ogg;
    }
    return ContainerFormat::webm;
}

const char* container_name(ContainerFormat format) {
    switch (format) {
    case ContainerFormat::webm:
        return "webm";
    case ContainerFormat::wav:
        return "wav";
    case ContainerFormat::mp3:
        return "mp3";
    case ContainerFormat::ogg:
        return "ogg";
    }
    return "webm";
}

}
}
