#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "speech_guard/utils/url.hpp"

namespace speech_guard {

class ViolationLogError : public std::runtime_error {
public:
    explicit ViolationLogError(const std::string& message) : std::runtime_error(message) {}
};

struct ViolationRecord {
    std::string log_id;
    std::string reason;
    std::string student_id;
    std::string exam_session_id;

    static ViolationRecord speech_detected(const std::string& student_id,
                                           const std::string& exam_session_id);
};

void to_json(nlohmann::json& j, const ViolationRecord& record);

class ViolationLogClient {
public:
    ViolationLogClient(const std::string& base_url,
                       std::optional<std::string> authorization_token,
                       std::chrono::milliseconds request_timeout);

    nlohmann::json post_violation(const ViolationRecord& record) const;

private:
    nlohmann::json parse_response(const httplib::Result& response) const;

    template<typename T>
    void apply_timeouts(T& client) const {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(request_timeout_);
        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            request_timeout_ - seconds);
        client.set_connection_timeout(seconds.count(), micros.count());
        client.set_read_timeout(seconds.count(), micros.count());
        client.set_write_timeout(seconds.count(), micros.count());
    }

    utils::Endpoint endpoint_;
    std::optional<std::string> authorization_token_;
    std::chrono::milliseconds request_timeout_;
};

}
