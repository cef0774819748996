#include "speech_guard/backend/violation_client.hpp"

#include <utility>

#include "speech_guard/utils/text.hpp"

namespace speech_guard {

ViolationRecord ViolationRecord::speech_detected(const std::string& student_id,
                                                 const std::string& exam_session_id) {
    return {utils::random_hex_id(), "SPEECH_DETECTED", student_id, exam_session_id};
}

void to_json(nlohmann::json& j, const ViolationRecord& record) {
    j = nlohmann::json{{"log_id", record.log_id},
                       {"reason", record.reason},
                       {"student_id", record.student_id},
                       {"exam_session_id", record.exam_session_id}};
}

ViolationLogClient::ViolationLogClient(const std::string& base_url,
                                       std::optional<std::string> authorization_token,
                                       std::chrono::milliseconds request_timeout)
    : endpoint_(utils::parse_endpoint(base_url)),
      authorization_token_(std::move(authorization_token)),
      request_timeout_(request_timeout) {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (endpoint_.scheme == "https") {
        throw ViolationLogError("HTTPS exam-log service requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
}

nlohmann::json ViolationLogClient::post_violation(const ViolationRecord& record) const {
    auto headers = httplib::Headers{{"Accept", "application/json"}};
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    const auto path = utils::join_path(endpoint_.base_path, "/api/exam/logs");
    const auto body = nlohmann::json(record).dump();

    auto send = [&](auto& client) {
        apply_timeouts(client);
        return client.Post(path.c_str(), headers, body, "application/json");
    };
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (endpoint_.scheme == "https") {
        httplib::SSLClient client(endpoint_.host, endpoint_.port);
        return parse_response(send(client));
    }
#endif
    httplib::Client client(endpoint_.host, endpoint_.port);
    return parse_response(send(client));
}

nlohmann::json ViolationLogClient::parse_response(const httplib::Result& response) const {
    if (!response) {
        throw ViolationLogError("exam-log request failed: " + httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        throw ViolationLogError("exam-log service returned " + std::to_string(response->status) +
                                ": " + response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ViolationLogError(std::string("exam-log service returned invalid JSON: ") + ex.what());
    }
}

}
