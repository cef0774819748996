#pragma once

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "speech_guard/deadline.hpp"

namespace speech_guard {
namespace vad {

class VadSession;

enum class RuntimeState {
    uninitialized,
    loading,
    ready,
    failed,
    shut_down,
};

const char* runtime_state_name(RuntimeState state);

class ModelRuntime {
public:
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        const VadSession& model() const { return *model_; }

    private:
        friend class ModelRuntime;
        Lease(ModelRuntime* runtime, VadSession* model);

        ModelRuntime* runtime_;
        VadSession* model_;
    };

    using SessionFactory = std::function<std::unique_ptr<VadSession>()>;

    ModelRuntime(std::filesystem::path model_path, int sampling_rate, std::size_t pool_size);
    ModelRuntime(SessionFactory factory, int sampling_rate, std::size_t pool_size,
                 std::string source);
    ~ModelRuntime();

    ModelRuntime(const ModelRuntime&) = delete;
    ModelRuntime& operator=(const ModelRuntime&) = delete;

    bool init();
    void shutdown();

    RuntimeState state() const;
    std::string failure_reason() const;
    int sampling_rate() const { return sampling_rate_; }
    std::size_t pool_size() const { return pool_size_; }

    Lease acquire(const Deadline& deadline);

private:
    void release(VadSession* model);

    SessionFactory factory_;
    std::string source_;
    int sampling_rate_;
    std::size_t pool_size_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    RuntimeState state_ = RuntimeState::uninitialized;
    std::string failure_reason_;
    std::vector<std::unique_ptr<VadSession>> models_;
    std::vector<VadSession*> idle_;
    std::size_t leased_ = 0;
};

}
}
