#pragma once

#include "qc_types.hpp"

#include <expected>
#include <string>
#include <vector>

namespace vad {

// Accepted reply shapes (values in ms, rounded to integers):
//   [[beg, end], ...]
//   [{"value": [[beg, end], ...]}, ...]   (first element only)
//   {"value": [[beg, end], ...]}
//   {"segments_ms": [[beg, end], ...]}
// Only an explicitly empty list means no speech. {"error": "..."}, text
// that is not JSON, any other shape and any entry that is not a pair of
// numbers are errors.
std::expected<std::vector<VadSegment>, std::string> parse_segments(const std::string& body);

} // namespace vad
