#pragma once

#include "vad/vad_engine.hpp"

// Runs a local command once per call. Placeholders in the argv template:
// {wav} (16-bit mono WAV written to a private temp dir), {device}, {model}.
// The command prints the segment JSON on stdout and exits 0.
class CommandVadEngine : public VadEngine {
public:
    CommandVadEngine(std::vector<std::string> argv_template, std::string model,
                     std::string device, std::string temp_root, int timeout_ms);

    std::expected<std::vector<VadSegment>, std::string>
        detect(std::span<const float> samples, uint32_t sample_rate) override;

    static std::vector<std::string> expand(const std::vector<std::string>& argv_template,
                                           const std::string& wav_path,
                                           const std::string& device,
                                           const std::string& model);

private:
    std::vector<std::string> argv_template_;
    std::string model_;
    std::string device_;
    std::string temp_root_;
    int timeout_ms_;
};
