#include "speech_guard/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace speech_guard {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 0.75,
                         1.0, 1.5, 2.5, 5.0, 10.0};
    detection_histogram_.buckets.assign(histogram_bounds_.size() + 1, 0);
    for (const char* outcome :
         {"detected", "not_detected", "decode_error", "model_unavailable", "timeout", "error"}) {
        outcomes_[outcome] = 0;
    }
}

void Metrics::record_outcome(const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++outcomes_[outcome];
}

uint64_t Metrics::outcome_count(const std::string& outcome) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = outcomes_.find(outcome);
    return it == outcomes_.end() ? 0 : it->second;
}

void Metrics::observe_detection_time(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = detection_histogram_;
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::observe_stage_time(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& summary = stage_summaries_[stage];
    summary.count += 1;
    summary.sum += seconds;
}

void Metrics::increment_degraded() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++degraded_total_;
}

uint64_t Metrics::degraded_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_total_;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP speech_detections_total Detection calls by outcome\n";
    out << "# TYPE speech_detections_total counter\n";
    for (const auto& item : outcomes_) {
        out << "speech_detections_total{outcome=\"" << item.first << "\"} "
            << item.second << "\n";
    }

    out << "# HELP speech_detection_seconds Time spent in one detection call\n";
    out << "# TYPE speech_detection_seconds histogram\n";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << "speech_detection_seconds_bucket{le=\"" << histogram_bounds_[i] << "\"} "
            << detection_histogram_.buckets[i] << "\n";
    }
    out << "speech_detection_seconds_bucket{le=\"+Inf\"} "
        << detection_histogram_.buckets.back() << "\n";
    out << "speech_detection_seconds_count " << detection_histogram_.count << "\n";
    out << "speech_detection_seconds_sum " << detection_histogram_.sum << "\n";

    out << "# HELP speech_stage_seconds Time spent per pipeline stage\n";
    out << "# TYPE speech_stage_seconds summary\n";
    for (const auto& item : stage_summaries_) {
        out << "speech_stage_seconds_count{stage=\"" << item.first << "\"} "
            << item.second.count << "\n";
        out << "speech_stage_seconds_sum{stage=\"" << item.first << "\"} "
            << item.second.sum << "\n";
    }

    out << "# HELP noise_suppression_degraded_total Clips analysed without noise suppression\n";
    out << "# TYPE noise_suppression_degraded_total counter\n";
    out << "noise_suppression_degraded_total " << degraded_total_ << "\n";

    return out.str();
}

}
