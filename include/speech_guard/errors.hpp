#pragma once

#include <stdexcept>
#include <string>

namespace speech_guard {

class DetectionError : public std::runtime_error {
public:
    explicit DetectionError(const std::string& message) : std::runtime_error(message) {}
};

class DecodeError : public DetectionError {
public:
    explicit DecodeError(const std::string& message) : DetectionError(message) {}
};

class ModelUnavailable : public DetectionError {
public:
    explicit ModelUnavailable(const std::string& message) : DetectionError(message) {}
};

class TimeoutExceeded : public DetectionError {
public:
    explicit TimeoutExceeded(const std::string& message) : DetectionError(message) {}
};

class StageDegraded : public DetectionError {
public:
    explicit StageDegraded(const std::string& message) : DetectionError(message) {}
};

}
