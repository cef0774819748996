#include "speech_guard/server/speech_api.hpp"

#include <stdexcept>
#include <utility>

#include "speech_guard/errors.hpp"
#include "speech_guard/logging.hpp"

namespace speech_guard {

const char* error_kind(const std::exception& ex) {
    if (dynamic_cast<const DecodeError*>(&ex)) {
        return "decode_error";
    }
    if (dynamic_cast<const ModelUnavailable*>(&ex)) {
        return "model_unavailable";
    }
    if (dynamic_cast<const TimeoutExceeded*>(&ex)) {
        return "timeout";
    }
    return "error";
}

nlohmann::json to_public_json(const pipeline::DetectionResult& result) {
    return nlohmann::json{{"speech_detected", result.speech_detected},
                          {"message", result.message},
                          {"timestamp", result.timestamp}};
}

SpeechApi::SpeechApi(std::shared_ptr<const pipeline::SpeechDetector> detector,
                     std::shared_ptr<const vad::ModelRuntime> runtime,
                     ViolationSink on_violation)
    : detector_(std::move(detector)),
      runtime_(std::move(runtime)),
      on_violation_(std::move(on_violation)) {
    if (!detector_) {
        throw std::invalid_argument("SpeechApi requires a detector");
    }
}

RestResponse SpeechApi::detect_speech(const DetectRequest& request) const {
    if (!request.clip || request.clip->bytes.empty()) {
        return {400, {{"detail", "audio file is required"}, {"error", "bad_request"}}};
    }

    pipeline::DetectionResult result;
    try {
        result = detector_->detect(*request.clip);
    } catch (const std::exception& ex) {
        logging::error("Speech detection request failed",
                       {kv("student_id", request.student_id),
                        kv("exam_session_id", request.exam_session_id),
                        kv("error", ex.what())});
        return {500,
                {{"detail", std::string("Error processing audio: ") + ex.what()},
                 {"error", error_kind(ex)}}};
    }

    if (result.speech_detected) {
        logging::info("Speech violation detected",
                      {kv("student_id", request.student_id),
                       kv("exam_session_id", request.exam_session_id),
                       kv("client_timestamp", request.timestamp)});
        if (on_violation_) {
            on_violation_(request.student_id, request.exam_session_id);
        }
    }

    auto body = to_public_json(result);
    body["student_id"] = request.student_id;
    body["exam_session_id"] = request.exam_session_id;
    return {200, std::move(body)};
}

RestResponse SpeechApi::health() const {
    const auto state = runtime_ ? runtime_->state() : vad::RuntimeState::uninitialized;
    nlohmann::json body{{"status", state == vad::RuntimeState::ready ? "ok" : "degraded"},
                        {"vad", vad::runtime_state_name(state)}};
    if (state == vad::RuntimeState::failed) {
        body["detail"] = runtime_->failure_reason();
    }
    return {200, std::move(body)};
}

}
