#pragma once

#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "speech_guard/config.hpp"
#include "speech_guard/server/speech_api.hpp"

namespace speech_guard {

DetectRequest parse_detect_request(const httplib::Request& request);

class RestServer {
public:
    RestServer(const Config& config, std::shared_ptr<const SpeechApi> api);

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    std::shared_ptr<const SpeechApi> api_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
