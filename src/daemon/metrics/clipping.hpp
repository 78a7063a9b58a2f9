#pragma once

#include "qc_types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace metrics {

// Runs of |x| >= clip_threshold lasting at least min_event_samples,
// in start order. Throws std::invalid_argument if sample_rate is 0.
std::vector<ClipEvent> find_clip_events(std::span<const float> samples, uint32_t sample_rate,
                                        double clip_threshold, size_t min_event_samples);

// Event count and one timestamp per event, strictly ascending. Each
// timestamp is the event start rounded to the nearest ms, except when that
// equals or precedes the previous one (two runs a few samples apart): it is
// then reported as previous + 1 ms, a time no event started at.
ClipDetail detect_clipping(std::span<const float> samples, uint32_t sample_rate,
                           double clip_threshold, size_t min_event_samples);

} // namespace metrics
