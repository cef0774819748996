#include <catch2/catch_test_macros.hpp>

#include "speech_guard/metrics.hpp"

#include <string>

using speech_guard::Metrics;

TEST_CASE("Metrics renders every detection outcome") {
    const auto text = Metrics::instance().render_prometheus();
    for (const char* outcome :
         {"detected", "not_detected", "decode_error", "model_unavailable", "timeout", "error"}) {
        REQUIRE(text.find(std::string("speech_detections_total{outcome=\"") + outcome + "\"}") !=
                std::string::npos);
    }
    REQUIRE(text.find("# TYPE speech_detection_seconds histogram") != std::string::npos);
    REQUIRE(text.find("noise_suppression_degraded_total") != std::string::npos);
}

TEST_CASE("Metrics counts outcomes and stage timings") {
    auto& metrics = Metrics::instance();
    const auto before = metrics.outcome_count("timeout");
    metrics.record_outcome("timeout");
    REQUIRE(metrics.outcome_count("timeout") == before + 1);

    metrics.observe_stage_time("metrics_check", 0.25);
    metrics.observe_detection_time(0.3);
    const auto text = metrics.render_prometheus();
    REQUIRE(text.find("speech_stage_seconds_count{stage=\"metrics_check\"} 1") != std::string::npos);
    REQUIRE(text.find("speech_stage_seconds_sum{stage=\"metrics_check\"} 0.250000") !=
            std::string::npos);
    REQUIRE(text.find("speech_detection_seconds_bucket{le=\"+Inf\"}") != std::string::npos);
}

TEST_CASE("Metrics counts degraded noise suppression") {
    auto& metrics = Metrics::instance();
    const auto before = metrics.degraded_count();
    metrics.increment_degraded();
    REQUIRE(metrics.degraded_count() == before + 1);
}
