#pragma once

#include "config.hpp"
#include "qc_types.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

// One voice-activity model instance. Not thread-safe: every GPU gate worker
// owns its own engine. Segments are in milliseconds, unmerged.
class VadEngine {
public:
    virtual ~VadEngine() = default;
    virtual std::expected<std::vector<VadSegment>, std::string>
        detect(std::span<const float> samples, uint32_t sample_rate) = 0;
};

// Engine for worker `worker_index` as selected by vad.type. HTTP engines are
// spread round robin over vad.urls.
std::unique_ptr<VadEngine> make_vad_engine(const Config& config, size_t worker_index);
