#include "speech_guard/vad/runtime.hpp"

#include <stdexcept>
#include <utility>

#include "speech_guard/errors.hpp"
#include "speech_guard/logging.hpp"
#include "speech_guard/vad/model.hpp"

namespace speech_guard {
namespace vad {

const char* runtime_state_name(RuntimeState state) {
    switch (state) {
    case RuntimeState::uninitialized:
        return "uninitialized";
    case RuntimeState::loading:
        return "loading";
    case RuntimeState::ready:
        return "ready";
    case RuntimeState::failed:
        return "failed";
    case RuntimeState::shut_down:
        return "shut_down";
    }
    return "unknown";
}

ModelRuntime::Lease::Lease(ModelRuntime* runtime, VadSession* model)
    : runtime_(runtime), model_(model) {}

ModelRuntime::Lease::Lease(Lease&& other) noexcept
    : runtime_(std::exchange(other.runtime_, nullptr)),
      model_(std::exchange(other.model_, nullptr)) {}

ModelRuntime::Lease::~Lease() {
    if (runtime_ && model_) {
        runtime_->release(model_);
    }
}

ModelRuntime::ModelRuntime(std::filesystem::path model_path, int sampling_rate,
                           std::size_t pool_size)
    : ModelRuntime(
          [model_path, sampling_rate]() -> std::unique_ptr<VadSession> {
              return std::make_unique<VadModel>(model_path, sampling_rate);
          },
          sampling_rate, pool_size, model_path.string()) {}

ModelRuntime::ModelRuntime(SessionFactory factory, int sampling_rate, std::size_t pool_size,
                           std::string source)
    : factory_(std::move(factory)),
      source_(std::move(source)),
      sampling_rate_(sampling_rate),
      pool_size_(pool_size) {
    if (pool_size_ == 0) {
        throw std::invalid_argument("VAD pool size must be positive");
    }
    if (!factory_) {
        throw std::invalid_argument("VAD session factory is empty");
    }
}

ModelRuntime::~ModelRuntime() {
    shutdown();
}

bool ModelRuntime::init() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return state_ != RuntimeState::loading; });
        if (state_ == RuntimeState::ready) {
            return true;
        }
        state_ = RuntimeState::loading;
        failure_reason_.clear();
    }

    info("Loading VAD model",
         {kv("path", source_),
          kv("sampling_rate", sampling_rate_),
          kv("sessions", pool_size_)});

    std::vector<std::unique_ptr<VadSession>> loaded;
    std::string failure;
    try {
        loaded.reserve(pool_size_);
        for (std::size_t i = 0; i < pool_size_; ++i) {
            auto session = factory_();
            if (!session) {
                throw std::runtime_error("session factory returned no session");
            }
            loaded.push_back(std::move(session));
        }
    } catch (const std::exception& ex) {
        failure = ex.what();
        loaded.clear();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure.empty()) {
        state_ = RuntimeState::failed;
        failure_reason_ = failure;
        cv_.notify_all();
        error("VAD model failed to load; speech detection unavailable",
              {kv("path", source_), kv("error", failure)});
        return false;
    }
    models_ = std::move(loaded);
    idle_.clear();
    for (auto& model : models_) {
        idle_.push_back(model.get());
    }
    state_ = RuntimeState::ready;
    cv_.notify_all();
    info("VAD model loaded", {kv("sessions", models_.size())});
    return true;
}

void ModelRuntime::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return state_ != RuntimeState::loading; });
    if (state_ != RuntimeState::ready) {
        return;
    }
    state_ = RuntimeState::shut_down;
    cv_.notify_all();
    cv_.wait(lock, [this] { return leased_ == 0; });
    idle_.clear();
    models_.clear();
    info("VAD model released");
}

RuntimeState ModelRuntime::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ModelRuntime::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

ModelRuntime::Lease ModelRuntime::acquire(const Deadline& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto usable = [this] {
        return state_ != RuntimeState::loading &&
               (state_ != RuntimeState::ready || !idle_.empty());
    };
    if (const auto& expires_at = deadline.expires_at()) {
        if (!cv_.wait_until(lock, *expires_at, usable)) {
            throw TimeoutExceeded("timed out waiting for a VAD session");
        }
    } else {
        cv_.wait(lock, usable);
    }

    switch (state_) {
    case RuntimeState::ready:
        break;
    case RuntimeState::failed:
        throw ModelUnavailable("VAD model failed to load: " + failure_reason_);
    case RuntimeState::shut_down:
        throw ModelUnavailable("VAD model has been shut down");
    default:
        throw ModelUnavailable("VAD model is not initialized");
    }

    VadSession* model = idle_.back();
    idle_.pop_back();
    ++leased_;
    return Lease(this, model);
}

void ModelRuntime::release(VadSession* model) {
    std::lock_guard<std::mutex> lock(mutex_);
    --leased_;
    if (state_ == RuntimeState::ready) {
        idle_.push_back(model);
    }
    cv_.notify_all();
}

}
}
