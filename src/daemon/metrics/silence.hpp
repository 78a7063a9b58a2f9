#pragma once

#include <span>

namespace metrics {

// RMS level relative to full scale (samples in [-1, 1]), in dB.
// Throws std::invalid_argument on an empty buffer.
double rms_dbfs(std::span<const float> samples);

bool is_silent(std::span<const float> samples, double silence_dbfs);

} // namespace metrics
