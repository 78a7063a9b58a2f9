#pragma once

#include "qc_types.hpp"

#include <cstdint>
#include <vector>

namespace metrics {

// Sort by start and fuse segments whose gap (next.start - prev.end) is
// <= merge_gap_ms. Overlapping segments always fuse; empty or inverted
// segments are dropped.
std::vector<VadSegment> merge_segments(std::vector<VadSegment> segments, int64_t merge_gap_ms);

// Sum of segment durations, not last.end - first.start.
int64_t speech_ms(const std::vector<VadSegment>& segments);

// round(clamp(speech_ms / duration_ms, 0, 1), 4); 0 when duration_ms <= 0.
double speech_ratio(int64_t speech_ms, int64_t duration_ms);

VadResult build_vad_result(std::vector<VadSegment> raw, int64_t merge_gap_ms);

double round_to(double value, int decimals);

double clamp01(double value);

} // namespace metrics
