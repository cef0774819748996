#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "speech_guard/vad/segmenter.hpp"

#include <initializer_list>
#include <utility>
#include <vector>

using Catch::Approx;
using speech_guard::vad::SegmenterParams;
using speech_guard::vad::collect_segments;

namespace {

constexpr std::size_t kWindow = 512;
constexpr int kRate = 16000;

// One probability per window; `pattern` repeats each value `count` times.
std::vector<float> probs(std::initializer_list<std::pair<float, int>> pattern) {
    std::vector<float> out;
    for (const auto& item : pattern) {
        out.insert(out.end(), static_cast<std::size_t>(item.second), item.first);
    }
    return out;
}

}

TEST_CASE("collect_segments finds nothing below the threshold") {
    const auto p = probs({{0.1f, 50}});
    REQUIRE(collect_segments(p, kWindow, p.size() * kWindow, kRate, SegmenterParams{}).empty());
    REQUIRE(collect_segments({}, kWindow, 0, kRate, SegmenterParams{}).empty());
}

TEST_CASE("collect_segments pads a single speech span") {
    // Speech in windows [10, 30), silence long enough to close the span.
    const auto p = probs({{0.0f, 10}, {0.9f, 20}, {0.0f, 20}});
    const auto segments = collect_segments(p, kWindow, p.size() * kWindow, kRate, SegmenterParams{});
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].start == 10 * kWindow - 480);
    REQUIRE(segments[0].end == 30 * kWindow + 480);
    REQUIRE(segments[0].duration_sec ==
            Approx(static_cast<double>(segments[0].end - segments[0].start) / kRate));
}

TEST_CASE("collect_segments drops spans shorter than the minimum speech duration") {
    // 5 windows = 160 ms < 250 ms.
    const auto p = probs({{0.0f, 10}, {0.9f, 5}, {0.0f, 20}});
    REQUIRE(collect_segments(p, kWindow, p.size() * kWindow, kRate, SegmenterParams{}).empty());
}

TEST_CASE("collect_segments bridges pauses shorter than the minimum silence") {
    // A 2-window (64 ms) dip stays inside the span; min silence is 100 ms.
    const auto p = probs({{0.9f, 10}, {0.0f, 2}, {0.9f, 10}, {0.0f, 20}});
    const auto segments = collect_segments(p, kWindow, p.size() * kWindow, kRate, SegmenterParams{});
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].start == 0);
    REQUIRE(segments[0].end == 22 * kWindow + 480);
}

TEST_CASE("collect_segments keeps probabilities between the two thresholds inside a span") {
    // 0.4 is below 0.5 but above 0.35, so it neither opens nor closes a span.
    const auto p = probs({{0.4f, 5}, {0.9f, 10}, {0.4f, 10}, {0.0f, 20}});
    const auto segments = collect_segments(p, kWindow, p.size() * kWindow, kRate, SegmenterParams{});
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].start == 5 * kWindow - 480);
    REQUIRE(segments[0].end == 25 * kWindow + 480);
}

TEST_CASE("collect_segments splits padding between close neighbours") {
    SegmenterParams params;
    params.speech_pad_ms = 100;  // 1600 samples; the 6-window gap is 3072 < 2 * 1600
    const auto p = probs({{0.9f, 10}, {0.0f, 6}, {0.9f, 10}, {0.0f, 20}});
    const auto segments = collect_segments(p, kWindow, p.size() * kWindow, kRate, params);
    REQUIRE(segments.size() == 2);
    REQUIRE(segments[0].end == 10 * kWindow + 3 * kWindow);
    REQUIRE(segments[1].start == 16 * kWindow - 3 * kWindow);
    REQUIRE(segments[0].end == segments[1].start);
}

TEST_CASE("collect_segments closes an open span at the end of the audio") {
    const auto p = probs({{0.0f, 5}, {0.9f, 20}});
    const std::size_t total = p.size() * kWindow - 100;
    const auto segments = collect_segments(p, kWindow, total, kRate, SegmenterParams{});
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].end == total);
}

TEST_CASE("collect_segments output is ascending and non-overlapping") {
    const auto p = probs({{0.9f, 12}, {0.0f, 8}, {0.9f, 12}, {0.0f, 8}, {0.9f, 12}, {0.0f, 8}});
    const auto segments = collect_segments(p, kWindow, p.size() * kWindow, kRate, SegmenterParams{});
    REQUIRE(segments.size() == 3);
    for (std::size_t i = 1; i < segments.size(); ++i) {
        REQUIRE(segments[i - 1].end <= segments[i].start);
        REQUIRE(segments[i - 1].start < segments[i - 1].end);
    }
}
