#include "speech_guard/config.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include "speech_guard/utils/text.hpp"

namespace speech_guard {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    const auto normalized = utils::to_lower(utils::trim(value));
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = utils::trim(line.substr(7));
        }
        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        const std::string key = utils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            continue;
        }
        const std::string value = strip_quotes(utils::trim(line.substr(eq_pos + 1)));
        setenv(key.c_str(), value.c_str(), 1);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;
    const auto cwd = std::filesystem::current_path();

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    config.log_name = get_env_str("LOG_NAME", "speech_guard");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }

    config.rest_api_host = get_env_str("REST_API_HOST", "0.0.0.0");
    config.rest_api_port = get_env_int("REST_API_PORT", 8001);
    config.rest_worker_threads = get_env_int("REST_WORKER_THREADS", 4);
    config.max_upload_bytes =
        static_cast<std::size_t>(std::max(0, get_env_int("MAX_UPLOAD_BYTES", 10 * 1024 * 1024)));
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.vad_model_path = std::filesystem::path(get_env_str("VAD_MODEL_PATH", cwd.string())) /
                            "silero_vad.onnx";
    config.vad_sampling_rate = get_env_int("VAD_SAMPLING_RATE", 16000);
    config.vad_threshold = get_env_double("VAD_THRESHOLD", 0.5);
    config.vad_min_speech_duration_ms = get_env_int("VAD_MIN_SPEECH_DURATION_MS", 250);
    config.vad_min_silence_duration_ms = get_env_int("VAD_MIN_SILENCE_DURATION_MS", 100);
    config.vad_speech_pad_ms = get_env_int("VAD_SPEECH_PAD_MS", 30);
    config.vad_pool_size = get_env_int("VAD_POOL_SIZE", 2);

    config.noise_suppression = get_env_bool("NOISE_SUPPRESSION", true);
    config.min_segment_duration_sec = get_env_double("MIN_SEGMENT_DURATION_SEC", 0.3);
    config.voicing_min_fraction = get_env_double("VOICING_MIN_FRACTION", 0.15);
    config.voicing_fmin_hz = get_env_double("VOICING_FMIN_HZ", 50.0);
    config.voicing_fmax_hz = get_env_double("VOICING_FMAX_HZ", 400.0);
    config.detection_timeout_ms = get_env_int("DETECTION_TIMEOUT_MS", 5000);
    config.max_clip_seconds = get_env_double("MAX_CLIP_SECONDS", 30.0);

    config.violation_log_url = get_env_optional("VIOLATION_LOG_URL");
    config.violation_request_timeout = get_env_double("VIOLATION_REQUEST_TIMEOUT", 10.0);

    return config;
}

void Config::validate() const {
    if (rest_api_port <= 0 || rest_api_port > 65535) {
        throw std::runtime_error("REST_API_PORT must be in 1..65535");
    }
    if (rest_worker_threads <= 0) {
        throw std::runtime_error("REST_WORKER_THREADS must be positive");
    }
    if (max_upload_bytes == 0) {
        throw std::runtime_error("MAX_UPLOAD_BYTES must be positive");
    }
    if (vad_sampling_rate != 8000 && vad_sampling_rate != 16000) {
        throw std::runtime_error("VAD_SAMPLING_RATE must be 8000 or 16000");
    }
    if (vad_threshold <= 0.0 || vad_threshold >= 1.0) {
        throw std::runtime_error("VAD_THRESHOLD must be in (0, 1)");
    }
    if (vad_min_speech_duration_ms < 0 || vad_min_silence_duration_ms < 0 ||
        vad_speech_pad_ms < 0) {
        throw std::runtime_error("VAD durations must be zero or positive");
    }
    if (vad_pool_size <= 0) {
        throw std::runtime_error("VAD_POOL_SIZE must be positive");
    }
    if (min_segment_duration_sec < 0.0) {
        throw std::runtime_error("MIN_SEGMENT_DURATION_SEC must be zero or positive");
    }
    if (voicing_min_fraction < 0.0 || voicing_min_fraction >= 1.0) {
        throw std::runtime_error("VOICING_MIN_FRACTION must be in [0, 1)");
    }
    if (voicing_fmin_hz <= 0.0 || voicing_fmax_hz <= voicing_fmin_hz) {
        throw std::runtime_error("VOICING_FMIN_HZ must be positive and below VOICING_FMAX_HZ");
    }
    if (voicing_fmax_hz * 2.0 > vad_sampling_rate) {
        throw std::runtime_error("VOICING_FMAX_HZ must be below half the sampling rate");
    }
    if (std::ceil(vad_sampling_rate / voicing_fmin_hz) + 2.0 >= pitch_frame_length()) {
        throw std::runtime_error("VOICING_FMIN_HZ is too low for a " +
                                 std::to_string(pitch_frame_length()) + "-sample pitch frame");
    }
    if (detection_timeout_ms <= 0) {
        throw std::runtime_error("DETECTION_TIMEOUT_MS must be positive");
    }
    if (max_clip_seconds <= 0.0) {
        throw std::runtime_error("MAX_CLIP_SECONDS must be positive");
    }
    if (violation_request_timeout <= 0.0) {
        throw std::runtime_error("VIOLATION_REQUEST_TIMEOUT must be positive");
    }
}

}
