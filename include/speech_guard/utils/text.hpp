#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace speech_guard::utils {

std::string to_lower(std::string value);
std::string trim(std::string value);

std::string mime_essence(const std::string& content_type);

std::string random_hex_id(std::size_t length = 32);

std::string iso8601_utc(std::chrono::system_clock::time_point time);

}
