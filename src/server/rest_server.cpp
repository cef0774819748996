#include "speech_guard/server/rest_server.hpp"

#include <chrono>
#include <stdexcept>

#include "speech_guard/logging.hpp"
#include "speech_guard/metrics.hpp"
#include "speech_guard/utils/text.hpp"

namespace speech_guard {

namespace {

std::string form_field(const httplib::Request& request, const char* name) {
    if (request.has_file(name)) {
        return request.get_file_value(name).content;
    }
    if (request.has_param(name)) {
        return request.get_param_value(name);
    }
    return "";
}

}

DetectRequest parse_detect_request(const httplib::Request& request) {
    DetectRequest parsed;
    if (request.is_multipart_form_data()) {
        if (request.has_file("audio")) {
            const auto& file = request.get_file_value("audio");
            if (!file.content.empty()) {
                parsed.clip = audio::AudioClip{file.content, file.content_type};
            }
        }
        parsed.student_id = form_field(request, "student_id");
        parsed.exam_session_id = form_field(request, "exam_session_id");
        parsed.timestamp = form_field(request, "timestamp");
        return parsed;
    }
    if (!request.body.empty()) {
        parsed.clip = audio::AudioClip{request.body, request.get_header_value("Content-Type")};
    }
    parsed.student_id = request.get_param_value("student_id");
    parsed.exam_session_id = request.get_param_value("exam_session_id");
    parsed.timestamp = request.get_param_value("timestamp");
    return parsed;
}

RestServer::RestServer(const Config& config, std::shared_ptr<const SpeechApi> api)
    : config_(config), api_(std::move(api)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();
    const auto workers = static_cast<size_t>(config_.rest_worker_threads);
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    server_->set_payload_max_length(config_.max_upload_bytes);

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        write_json(res, api_->health());
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/api/exam/detect-speech",
                  [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto started = std::chrono::steady_clock::now();
        const auto request = parse_detect_request(req);
        const auto response = api_->detect_speech(request);
        write_json(res, response);
        logging::debug(
            "Detect-speech request served",
            {kv("status", response.status),
             kv("mime_type", request.clip ? utils::mime_essence(request.clip->mime_type) : ""),
             kv("bytes", request.clip ? request.clip->bytes.size() : 0),
             kv("elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - started).count())});
    });

    if (!server_->bind_to_port(config_.rest_api_host, config_.rest_api_port)) {
        throw std::runtime_error("failed to bind REST server to " + config_.rest_api_host + ":" +
                                 std::to_string(config_.rest_api_port));
    }
    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("host", config_.rest_api_host),
             kv("port", config_.rest_api_port),
             kv("workers", config_.rest_worker_threads)});
        server_->listen_after_bind();
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"detail":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"detail":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
