#pragma once

#include <string>

namespace speech_guard::utils {

struct Endpoint {
    std::string scheme = "http";
    std::string host;
    int port = 80;
    std::string base_path;
};

Endpoint parse_endpoint(const std::string& url);

std::string join_path(const std::string& base_path, const std::string& path);

}
