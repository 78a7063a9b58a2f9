#include "metrics/clarity.hpp"

#include "metrics/vad_segments.hpp"

#include <algorithm>
#include <cmath>
#include <fftw3.h>
#include <mutex>
#include <new>
#include <numbers>
#include <stdexcept>
#include <vector>

namespace metrics {

namespace {

constexpr double kEps = 1e-12;
constexpr double kNoisePercentile = 0.10;
constexpr double kSignalPercentile = 0.90;

// fftw planner calls are not thread-safe; fftw_execute on distinct plans is.
std::mutex& planner_mutex() {
    static std::mutex m;
    return m;
}

class RealFft {
public:
    explicit RealFft(size_t n) : n_(n) {
        in_ = static_cast<double*>(fftw_malloc(sizeof(double) * n_));
        out_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * bins()));
        if (!in_ || !out_) {
            release();
            throw std::bad_alloc();
        }
        std::lock_guard lock(planner_mutex());
        plan_ = fftw_plan_dft_r2c_1d(static_cast<int>(n_), in_, out_, FFTW_ESTIMATE);
        if (!plan_) {
            release();
            throw std::runtime_error("fftw_plan_dft_r2c_1d failed");
        }
    }

    ~RealFft() { release(); }

    RealFft(const RealFft&) = delete;
    RealFft& operator=(const RealFft&) = delete;

    size_t size() const { return n_; }
    size_t bins() const { return n_ / 2 + 1; }
    double* input() { return in_; }

    // Power spectrum |X[k]|^2 of the current input.
    void power(std::vector<double>& out) {
        fftw_execute(plan_);
        out.resize(bins());
        for (size_t k = 0; k < bins(); k++) {
            out[k] = out_[k][0] * out_[k][0] + out_[k][1] * out_[k][1];
        }
    }

private:
    void release() {
        if (plan_) {
            std::lock_guard lock(planner_mutex());
            fftw_destroy_plan(plan_);
            plan_ = nullptr;
        }
        if (in_) { fftw_free(in_); in_ = nullptr; }
        if (out_) { fftw_free(out_); out_ = nullptr; }
    }

    size_t n_;
    double* in_ = nullptr;
    fftw_complex* out_ = nullptr;
    fftw_plan plan_ = nullptr;
};

std::vector<double> periodic_hann(size_t n) {
    std::vector<double> w(n);
    for (size_t k = 0; k < n; k++) {
        w[k] = 0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * static_cast<double>(k) /
                                    static_cast<double>(n));
    }
    return w;
}

// Nearest-rank percentile of a sorted series.
double percentile(const std::vector<double>& sorted, double p) {
    auto rank = static_cast<size_t>(std::ceil(p * static_cast<double>(sorted.size())));
    rank = std::clamp<size_t>(rank, 1, sorted.size());
    return sorted[rank - 1];
}

// 0 below lo1, ramp up to hi1, plateau at 1 until lo2, ramp down to 0 at hi2.
double two_segment(double x, double lo1, double hi1, double lo2, double hi2) {
    if (x <= lo1) return 0.0;
    if (x < hi1) return (x - lo1) / (hi1 - lo1);
    if (x <= lo2) return 1.0;
    if (x < hi2) return 1.0 - (x - lo2) / (hi2 - lo2);
    return 0.0;
}

} // namespace

ClarityMeasurement measure_clarity(std::span<const float> samples, uint32_t sample_rate,
                                   const Config::Clarity& cfg) {
    if (samples.empty()) throw std::invalid_argument("measure_clarity: empty sample buffer");
    if (sample_rate == 0) throw std::invalid_argument("measure_clarity: sample_rate is 0");

    auto win = static_cast<size_t>(std::lround(sample_rate * cfg.win_ms / 1000.0));
    auto hop = static_cast<size_t>(std::lround(sample_rate * cfg.hop_ms / 1000.0));
    if (win < 2 || hop == 0) {
        throw std::invalid_argument("measure_clarity: window/hop too short for sample rate");
    }

    RealFft fft(win);
    auto window = periodic_hann(win);

    size_t n_frames = samples.size() < win ? 1 : 1 + (samples.size() - win) / hop;

    double nyquist = sample_rate / 2.0;
    double hf_hi = std::min(cfg.hf_hi_hz, nyquist);
    double bin_hz = static_cast<double>(sample_rate) / static_cast<double>(win);

    std::vector<double> power;
    std::vector<double> frame_energy(n_frames);
    double e_hi = 0.0;
    double e_base = 0.0;
    double flat_sum = 0.0;

    for (size_t f = 0; f < n_frames; f++) {
        size_t start = f * hop;
        double* in = fft.input();
        for (size_t k = 0; k < win; k++) {
            size_t idx = start + k;
            in[k] = idx < samples.size() ? samples[idx] * window[k] : 0.0;
        }
        fft.power(power);

        double energy = 0.0;
        double log_sum = 0.0;
        for (size_t b = 0; b < power.size(); b++) {
            double p = power[b];
            energy += p;

            double freq = static_cast<double>(b) * bin_hz;
            if (freq <= hf_hi) {
                e_base += p;
                if (freq >= cfg.hf_lo_hz) e_hi += p;
            }

            log_sum += std::log(std::max(p, kEps));
        }
        frame_energy[f] = energy;

        double bins = static_cast<double>(power.size());
        double arith = 0.0;
        for (double p : power) arith += std::max(p, kEps);
        arith /= bins;
        double geo = std::exp(log_sum / bins);
        flat_sum += geo / std::max(arith, kEps);
    }

    std::ranges::sort(frame_energy);
    double noise = std::max(percentile(frame_energy, kNoisePercentile), kEps);
    double signal = std::max(percentile(frame_energy, kSignalPercentile), kEps);

    return {
        .snr_db = 10.0 * std::log10(signal / noise),
        .hf_ratio = e_hi / (e_base + kEps),
        .spectral_flatness = flat_sum / static_cast<double>(n_frames),
    };
}

double snr_score(double snr_db, const Config::Clarity& cfg) {
    return two_segment(snr_db, cfg.snr_min_db, cfg.snr_max_db, cfg.snr_min_db2, cfg.snr_max_db2);
}

double hf_score(double hf_ratio, const Config::Clarity& cfg) {
    return two_segment(hf_ratio, 0.0, cfg.hf_ref, cfg.hf_ref2_l, cfg.hf_ref2_h);
}

double flat_score(double spectral_flatness, const Config::Clarity& cfg) {
    return clamp01(1.0 - spectral_flatness / cfg.flat_ref);
}

double composite_clarity(double snr_s, double hf_s, double flat_s, const Config::Clarity& cfg) {
    double total = cfg.w_snr + cfg.w_hf + cfg.w_flat;
    if (total <= 0.0) {
        throw std::invalid_argument("composite_clarity: weights must have a positive sum");
    }
    double w_snr = cfg.w_snr / total;
    double w_hf = cfg.w_hf / total;
    double w_flat = cfg.w_flat / total;
    return 100.0 * (w_snr * snr_s + w_hf * hf_s + w_flat * flat_s);
}

ClarityDetail compute_clarity(std::span<const float> samples, uint32_t sample_rate,
                              const Config::Clarity& cfg) {
    auto m = measure_clarity(samples, sample_rate, cfg);

    ClarityDetail d;
    d.snr_db = m.snr_db;
    d.hf_ratio = m.hf_ratio;
    d.spectral_flatness = m.spectral_flatness;
    d.snr_score = snr_score(m.snr_db, cfg);
    d.hf_score = hf_score(m.hf_ratio, cfg);
    d.flat_score = flat_score(m.spectral_flatness, cfg);
    d.clarity = composite_clarity(d.snr_score, d.hf_score, d.flat_score, cfg);
    return d;
}

} // namespace metrics
