#include "metrics/clipping.hpp"

#include <cmath>
#include <stdexcept>

namespace metrics {

std::vector<ClipEvent> find_clip_events(std::span<const float> samples, uint32_t sample_rate,
                                        double clip_threshold, size_t min_event_samples) {
    if (sample_rate == 0) {
        throw std::invalid_argument("find_clip_events: sample_rate is 0");
    }

    std::vector<ClipEvent> events;
    auto emit = [&](size_t start, size_t len) {
        if (len < min_event_samples) return;
        auto ms = std::llround(static_cast<double>(start) * 1000.0 / sample_rate);
        events.push_back({.start_ms = static_cast<int64_t>(ms), .length = len});
    };

    size_t run_start = 0;
    size_t run_len = 0;
    for (size_t i = 0; i < samples.size(); i++) {
        if (std::fabs(static_cast<double>(samples[i])) >= clip_threshold) {
            if (run_len == 0) run_start = i;
            run_len++;
        } else if (run_len > 0) {
            emit(run_start, run_len);
            run_len = 0;
        }
    }
    if (run_len > 0) emit(run_start, run_len);

    return events;
}

ClipDetail detect_clipping(std::span<const float> samples, uint32_t sample_rate,
                           double clip_threshold, size_t min_event_samples) {
    auto events = find_clip_events(samples, sample_rate, clip_threshold, min_event_samples);

    ClipDetail detail;
    detail.clip_count = events.size();
    detail.times_ms.reserve(events.size());
    for (const auto& e : events) {
        // Two runs separated by a single sample can round to the same ms at
        // 16 kHz; keep the series strictly ascending.
        auto t = e.start_ms;
        if (!detail.times_ms.empty() && t <= detail.times_ms.back()) {
            t = detail.times_ms.back() + 1;
        }
        detail.times_ms.push_back(t);
    }
    return detail;
}

} // namespace metrics
