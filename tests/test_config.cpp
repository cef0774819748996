#include <catch2/catch_test_macros.hpp>

#include "speech_guard/config.hpp"
#include "speech_guard/pipeline/detector.hpp"
#include "speech_guard/voicing/pitch.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~EnvGuard() { unsetenv(name_); }

    const char* name_;
};

}

TEST_CASE("Config defaults validate") {
    speech_guard::Config config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.vad_sampling_rate == 16000);
    REQUIRE(config.min_segment_duration_sec == 0.3);
    REQUIRE(config.voicing_min_fraction == 0.15);
    REQUIRE(config.detection_timeout_ms == 5000);
}

TEST_CASE("Config::load reads detection settings from the environment") {
    EnvGuard threshold("VAD_THRESHOLD", "0.6");
    EnvGuard fraction("VOICING_MIN_FRACTION", "0.25");
    EnvGuard denoise("NOISE_SUPPRESSION", "false");
    EnvGuard model("VAD_MODEL_PATH", "/opt/models");

    const auto config = speech_guard::Config::load();
    REQUIRE(config.vad_threshold == 0.6);
    REQUIRE(config.voicing_min_fraction == 0.25);
    REQUIRE_FALSE(config.noise_suppression);
    REQUIRE(config.vad_model_path == std::filesystem::path("/opt/models/silero_vad.onnx"));
}

TEST_CASE("Config::load rejects non-numeric values") {
    EnvGuard port("REST_API_PORT", "eighty");
    REQUIRE_THROWS_AS(speech_guard::Config::load(), std::runtime_error);
}

TEST_CASE("Config::validate rejects out-of-range settings") {
    speech_guard::Config config;
    config.vad_sampling_rate = 44100;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = speech_guard::Config{};
    config.vad_threshold = 1.0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = speech_guard::Config{};
    config.vad_sampling_rate = 8000;
    config.voicing_fmax_hz = 4500.0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = speech_guard::Config{};
    config.detection_timeout_ms = 0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = speech_guard::Config{};
    config.max_clip_seconds = 0.0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("Config::validate keeps the lowest pitch period inside one pitch frame") {
    speech_guard::Config config;
    config.voicing_fmin_hz = 16.0;
    REQUIRE_NOTHROW(config.validate());

    config.voicing_fmin_hz = 15.0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = speech_guard::Config{};
    config.vad_sampling_rate = 8000;
    config.voicing_fmin_hz = 20.0;
    REQUIRE_NOTHROW(config.validate());

    config.voicing_fmin_hz = 15.0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("Detector settings from a validated config build a pitch tracker") {
    speech_guard::Config config;
    config.voicing_fmin_hz = 16.0;
    REQUIRE_NOTHROW(config.validate());
    const auto options = speech_guard::pipeline::DetectorOptions::from_config(config);
    REQUIRE(options.pitch.frame_length == static_cast<std::size_t>(config.pitch_frame_length()));
    REQUIRE_NOTHROW(speech_guard::voicing::PitchTracker(config.vad_sampling_rate, options.pitch));
}
