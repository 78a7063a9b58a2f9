#include "metrics/silence.hpp"

#include <cmath>
#include <stdexcept>

namespace metrics {

namespace {
constexpr double kEps = 1e-12;
}

double rms_dbfs(std::span<const float> samples) {
    if (samples.empty()) {
        throw std::invalid_argument("rms_dbfs: empty sample buffer");
    }

    double sum_sq = 0.0;
    for (float s : samples) {
        double v = s;
        sum_sq += v * v;
    }
    double rms = std::sqrt(sum_sq / static_cast<double>(samples.size()) + kEps);
    return 20.0 * std::log10(rms);
}

bool is_silent(std::span<const float> samples, double silence_dbfs) {
    return rms_dbfs(samples) <= silence_dbfs;
}

} // namespace metrics
