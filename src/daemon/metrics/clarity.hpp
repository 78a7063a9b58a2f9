#pragma once

#include "config.hpp"
#include "qc_types.hpp"

#include <cstdint>
#include <span>

namespace metrics {

struct ClarityMeasurement {
    double snr_db = 0.0;
    double hf_ratio = 0.0;
    double spectral_flatness = 0.0;
};

// STFT-based raw measurements. Throws std::invalid_argument on an empty
// buffer, a zero sample rate, or a window shorter than two samples.
ClarityMeasurement measure_clarity(std::span<const float> samples, uint32_t sample_rate,
                                   const Config::Clarity& cfg);

// Sub-score normalization, each in [0, 1].
double snr_score(double snr_db, const Config::Clarity& cfg);
double hf_score(double hf_ratio, const Config::Clarity& cfg);
double flat_score(double spectral_flatness, const Config::Clarity& cfg);

// 100 * weighted mean of the sub-scores; weights are re-normalized to sum to 1.
double composite_clarity(double snr_s, double hf_s, double flat_s, const Config::Clarity& cfg);

// Rule-based clarity "v1": measurement, normalization, composite.
ClarityDetail compute_clarity(std::span<const float> samples, uint32_t sample_rate,
                              const Config::Clarity& cfg);

} // namespace metrics
