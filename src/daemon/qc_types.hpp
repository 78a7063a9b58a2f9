#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr uint32_t kTargetSampleRate = 16000;

// Mono PCM in [-1, 1] after decode + resample.
struct DecodedAudio {
    std::vector<float> samples;
    uint32_t sample_rate = kTargetSampleRate;
    int64_t duration_ms = 0;
};

struct ClipEvent {
    int64_t start_ms = 0;
    size_t length = 0; // samples in the run
};

struct ClipDetail {
    size_t clip_count = 0;
    std::vector<int64_t> times_ms; // ascending, one per event
};

struct ClarityDetail {
    double snr_db = 0.0;
    double hf_ratio = 0.0;
    double spectral_flatness = 0.0;

    double snr_score = 0.0;
    double hf_score = 0.0;
    double flat_score = 0.0;

    double clarity = 0.0; // composite, [0, 100]
};

struct VadSegment {
    int64_t start_ms = 0;
    int64_t end_ms = 0;

    bool operator==(const VadSegment&) const = default;
};

struct VadResult {
    std::vector<VadSegment> segments_ms;
    int64_t speech_ms = 0;
};

struct QcResult {
    bool is_silent = false;
    bool has_speech = false;
    double speech_ratio = 0.0;
    bool has_clip = false;
    std::optional<ClipDetail> clip_detail;
    std::optional<ClarityDetail> clarity;
    VadResult vad;
    int64_t duration_ms = 0;
};

// One uploaded file, owned by the request context until it terminates.
struct QcRequest {
    std::string request_id;
    std::vector<uint8_t> bytes;
    uint64_t declared_size = 0;
    std::string filename;
};
