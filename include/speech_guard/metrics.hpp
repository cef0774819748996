#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace speech_guard {

class Metrics {
public:
    static Metrics& instance();

    void record_outcome(const std::string& outcome);
    uint64_t outcome_count(const std::string& outcome) const;
    void observe_detection_time(double seconds);
    void observe_stage_time(const std::string& stage, double seconds);
    void increment_degraded();
    uint64_t degraded_count() const;
    std::string render_prometheus() const;

private:
    struct SummarySeries {
        uint64_t count = 0;
        double sum = 0.0;
    };

    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> outcomes_;
    std::map<std::string, SummarySeries> stage_summaries_;
    HistogramSeries detection_histogram_;
    std::vector<double> histogram_bounds_;
    uint64_t degraded_total_ = 0;
};

}
