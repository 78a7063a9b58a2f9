#include "metrics/vad_segments.hpp"

#include <algorithm>
#include <cmath>

namespace metrics {

std::vector<VadSegment> merge_segments(std::vector<VadSegment> segments, int64_t merge_gap_ms) {
    std::erase_if(segments, [](const VadSegment& s) { return s.end_ms <= s.start_ms; });
    if (segments.empty()) return {};

    std::ranges::stable_sort(segments, {}, &VadSegment::start_ms);

    std::vector<VadSegment> merged;
    merged.reserve(segments.size());
    merged.push_back(segments.front());

    for (size_t i = 1; i < segments.size(); i++) {
        auto& prev = merged.back();
        const auto& next = segments[i];
        if (next.start_ms - prev.end_ms <= merge_gap_ms) {
            prev.end_ms = std::max(prev.end_ms, next.end_ms);
        } else {
            merged.push_back(next);
        }
    }
    return merged;
}

int64_t speech_ms(const std::vector<VadSegment>& segments) {
    int64_t total = 0;
    for (const auto& s : segments) {
        total += std::max<int64_t>(0, s.end_ms - s.start_ms);
    }
    return total;
}

double speech_ratio(int64_t speech, int64_t duration_ms) {
    if (duration_ms <= 0) return 0.0;
    double ratio = static_cast<double>(speech) / static_cast<double>(duration_ms);
    return round_to(clamp01(ratio), 4);
}

VadResult build_vad_result(std::vector<VadSegment> raw, int64_t merge_gap_ms) {
    VadResult result;
    result.segments_ms = merge_segments(std::move(raw), merge_gap_ms);
    result.speech_ms = speech_ms(result.segments_ms);
    return result;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double clamp01(double value) {
    if (value < 0.0) return 0.0;
    if (value > 1.0) return 1.0;
    return value;
}

} // namespace metrics
