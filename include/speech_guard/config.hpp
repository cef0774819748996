#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace speech_guard {

struct Config {
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::string log_name = "speech_guard";

    std::string rest_api_host = "0.0.0.0";
    int rest_api_port = 8001;
    int rest_worker_threads = 4;
    std::size_t max_upload_bytes = 10 * 1024 * 1024;
    std::optional<std::string> authorization_token;

    std::filesystem::path vad_model_path;
    int vad_sampling_rate = 16000;
    double vad_threshold = 0.5;
    int vad_min_speech_duration_ms = 250;
    int vad_min_silence_duration_ms = 100;
    int vad_speech_pad_ms = 30;
    int vad_pool_size = 2;

    bool noise_suppression = true;
    double min_segment_duration_sec = 0.3;
    double voicing_min_fraction = 0.15;
    double voicing_fmin_hz = 50.0;
    double voicing_fmax_hz = 400.0;
    int detection_timeout_ms = 5000;
    double max_clip_seconds = 30.0;

    std::optional<std::string> violation_log_url;
    double violation_request_timeout = 10.0;

    int pitch_frame_length() const { return vad_sampling_rate == 8000 ? 512 : 1024; }

    static Config load();
    void validate() const;
};

}
