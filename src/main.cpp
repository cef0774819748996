#include "speech_guard/backend/violation_client.hpp"
#include "speech_guard/config.hpp"
#include "speech_guard/logging.hpp"
#include "speech_guard/pipeline/detector.hpp"
#include "speech_guard/server/rest_server.hpp"
#include "speech_guard/server/speech_api.hpp"
#include "speech_guard/utils/work_queue.hpp"
#include "speech_guard/vad/runtime.hpp"
#include "speech_guard/vad/segmenter.hpp"

#include <chrono>
#include <csignal>
#include <pthread.h>
#include <signal.h>
#include <cstddef>
#include <memory>
#include <string>

namespace {

constexpr std::size_t kViolationQueueCapacity = 64;

speech_guard::SpeechApi::ViolationSink make_violation_sink(
    const speech_guard::Config& config, std::shared_ptr<speech_guard::utils::WorkQueue> queue) {
    if (!config.violation_log_url) {
        return {};
    }
    auto client = std::make_shared<speech_guard::ViolationLogClient>(
        *config.violation_log_url, config.authorization_token,
        std::chrono::milliseconds(static_cast<long>(config.violation_request_timeout * 1000.0)));
    return [client, queue](const std::string& student_id, const std::string& exam_session_id) {
        const auto record =
            speech_guard::ViolationRecord::speech_detected(student_id, exam_session_id);
        const bool queued = queue->post([client, record]() {
            try {
                client->post_violation(record);
                speech_guard::info("Violation log recorded",
                                   {speech_guard::kv("log_id", record.log_id),
                                    speech_guard::kv("student_id", record.student_id)});
            } catch (const speech_guard::ViolationLogError& ex) {
                speech_guard::warn("Failed to record violation log",
                                   {speech_guard::kv("log_id", record.log_id),
                                    speech_guard::kv("error", ex.what())});
            }
        });
        if (!queued) {
            speech_guard::warn("Violation log dropped; delivery queue is full or stopped",
                               {speech_guard::kv("log_id", record.log_id),
                                speech_guard::kv("student_id", record.student_id)});
        }
    };
}

}

int main() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        const auto config = speech_guard::Config::load();
        config.validate();
        speech_guard::logging::init(config);
        speech_guard::info(
            "Starting speech-guard",
            {speech_guard::kv("rest_port", config.rest_api_port),
             speech_guard::kv("vad_model", config.vad_model_path.string()),
             speech_guard::kv("sampling_rate", config.vad_sampling_rate),
             speech_guard::kv("noise_suppression", config.noise_suppression),
             speech_guard::kv("violation_log", config.violation_log_url.value_or("disabled"))});

        auto runtime = std::make_shared<speech_guard::vad::ModelRuntime>(
            config.vad_model_path, config.vad_sampling_rate,
            static_cast<std::size_t>(config.vad_pool_size));
        if (!runtime->init()) {
            speech_guard::warn("Serving without a VAD model; detections will fail",
                               {speech_guard::kv("reason", runtime->failure_reason())});
        }

        speech_guard::vad::SegmenterParams params;
        params.threshold = static_cast<float>(config.vad_threshold);
        params.min_speech_duration_ms = config.vad_min_speech_duration_ms;
        params.min_silence_duration_ms = config.vad_min_silence_duration_ms;
        params.speech_pad_ms = config.vad_speech_pad_ms;
        auto segmenter = std::make_shared<speech_guard::vad::SileroSegmenter>(runtime, params);
        auto detector = std::make_shared<speech_guard::pipeline::SpeechDetector>(
            speech_guard::pipeline::DetectorOptions::from_config(config), segmenter);
        auto violation_queue =
            std::make_shared<speech_guard::utils::WorkQueue>(kViolationQueueCapacity);
        auto api = std::make_shared<speech_guard::SpeechApi>(
            detector, runtime, make_violation_sink(config, violation_queue));

        speech_guard::RestServer server(config, api);
        server.start();

        int received = 0;
        sigwait(&signals, &received);
        speech_guard::info("Shutting down", {speech_guard::kv("signal", received)});
        server.stop();
        violation_queue->stop();
        runtime->shutdown();
    } catch (const std::exception& ex) {
        speech_guard::error(
            "Startup failed",
            {speech_guard::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
