#include "speech_guard/utils/url.hpp"

#include <stdexcept>

#include "speech_guard/utils/text.hpp"

namespace speech_guard::utils {

Endpoint parse_endpoint(const std::string& url) {
    Endpoint endpoint;
    std::string working = trim(url);

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        endpoint.scheme = to_lower(working.substr(0, scheme_pos));
        working = working.substr(scheme_pos + 3);
    }
    if (endpoint.scheme != "http" && endpoint.scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme: " + endpoint.scheme);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        endpoint.base_path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    }

    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        endpoint.host = working.substr(0, port_pos);
        const auto port_text = working.substr(port_pos + 1);
        try {
            std::size_t consumed = 0;
            endpoint.port = std::stoi(port_text, &consumed);
            if (consumed != port_text.size()) {
                throw std::invalid_argument(port_text);
            }
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid port in URL: " + url);
        }
        if (endpoint.port <= 0 || endpoint.port > 65535) {
            throw std::invalid_argument("port out of range in URL: " + url);
        }
    } else {
        endpoint.host = working;
        endpoint.port = endpoint.scheme == "https" ? 443 : 80;
    }
    if (endpoint.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    return endpoint;
}

std::string join_path(const std::string& base_path, const std::string& path) {
    if (base_path.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path;
    }
    if (base_path.back() == '/' && path.front() == '/') {
        return base_path + path.substr(1);
    }
    if (base_path.back() != '/' && path.front() != '/') {
        return base_path + "/" + path;
    }
    return base_path + path;
}

}
