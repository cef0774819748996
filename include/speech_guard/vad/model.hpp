#pragma once

#include <filesystem>
#include <memory>
#include <vector>

namespace speech_guard {
namespace vad {

class VadSession {
public:
    virtual ~VadSession() = default;

    virtual std::vector<float> initialize_state() const = 0;

    virtual float get_speech_prob(const std::vector<float>& audio,
                                  std::vector<float>* state) const = 0;
};

class VadModel : public VadSession {
public:
    VadModel(const std::filesystem::path& model_path, int sampling_rate);
    ~VadModel() override;

    int sampling_rate() const;
    std::vector<float> initialize_state() const override;
    float get_speech_prob(const std::vector<float>& audio,
                          std::vector<float>* state) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
