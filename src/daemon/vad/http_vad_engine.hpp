#pragma once

#include "vad/vad_engine.hpp"

// Posts a 16-bit WAV to a model server's /v1/vad endpoint as
// multipart/form-data (fields: file, model, device) and reads segments from
// the JSON reply.
class HttpVadEngine : public VadEngine {
public:
    HttpVadEngine(std::string url, std::string model, std::string device, long timeout_s);
    ~HttpVadEngine() override;

    HttpVadEngine(const HttpVadEngine&) = delete;
    HttpVadEngine& operator=(const HttpVadEngine&) = delete;

    std::expected<std::vector<VadSegment>, std::string>
        detect(std::span<const float> samples, uint32_t sample_rate) override;

    const std::string& url() const { return url_; }

private:
    std::string url_;
    std::string model_;
    std::string device_;
    long timeout_s_;
};
