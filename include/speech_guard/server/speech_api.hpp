#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "speech_guard/audio/clip.hpp"
#include "speech_guard/pipeline/detector.hpp"
#include "speech_guard/vad/runtime.hpp"

namespace speech_guard {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

struct DetectRequest {
    std::optional<audio::AudioClip> clip;
    std::string student_id;
    std::string exam_session_id;
    std::string timestamp;
};

const char* error_kind(const std::exception& ex);

nlohmann::json to_public_json(const pipeline::DetectionResult& result);

class SpeechApi {
public:
    using ViolationSink =
        std::function<void(const std::string& student_id, const std::string& exam_session_id)>;

    SpeechApi(std::shared_ptr<const pipeline::SpeechDetector> detector,
              std::shared_ptr<const vad::ModelRuntime> runtime,
              ViolationSink on_violation = {});

    RestResponse detect_speech(const DetectRequest& request) const;
    RestResponse health() const;

private:
    std::shared_ptr<const pipeline::SpeechDetector> detector_;
    std::shared_ptr<const vad::ModelRuntime> runtime_;
    ViolationSink on_violation_;
};

}
