#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "speech_guard/errors.hpp"

namespace speech_guard {

class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    static Deadline unbounded() { return Deadline(); }

    static Deadline after(std::chrono::milliseconds budget) {
        Deadline deadline;
        deadline.budget_ = budget;
        deadline.expires_at_ = Clock::now() + budget;
        return deadline;
    }

    const std::optional<Clock::time_point>& expires_at() const { return expires_at_; }

    bool expired() const {
        return expires_at_ && Clock::now() >= *expires_at_;
    }

    void check(const std::string& stage) const {
        if (expired()) {
            throw TimeoutExceeded("detection budget of " + std::to_string(budget_.count()) +
                                  " ms exceeded during " + stage);
        }
    }

private:
    Deadline() = default;

    std::optional<Clock::time_point> expires_at_;
    std::chrono::milliseconds budget_{0};
};

}
