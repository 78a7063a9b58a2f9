#include "vad/command_vad_engine.hpp"

#include "subprocess.hpp"
#include "temp_dir.hpp"
#include "vad/segment_parser.hpp"
#include "wav_codec.hpp"

#include <fstream>

namespace {

void replace_all(std::string& s, std::string_view from, const std::string& to) {
    for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

} // namespace

CommandVadEngine::CommandVadEngine(std::vector<std::string> argv_template, std::string model,
                                   std::string device, std::string temp_root, int timeout_ms)
    : argv_template_(std::move(argv_template)), model_(std::move(model)),
      device_(std::move(device)), temp_root_(std::move(temp_root)), timeout_ms_(timeout_ms) {}

std::vector<std::string> CommandVadEngine::expand(const std::vector<std::string>& argv_template,
                                                  const std::string& wav_path,
                                                  const std::string& device,
                                                  const std::string& model) {
    std::vector<std::string> argv = argv_template;
    for (auto& arg : argv) {
        replace_all(arg, "{wav}", wav_path);
        replace_all(arg, "{device}", device);
        replace_all(arg, "{model}", model);
    }
    return argv;
}

std::expected<std::vector<VadSegment>, std::string>
CommandVadEngine::detect(std::span<const float> samples, uint32_t sample_rate) {
    if (samples.empty()) {
        return std::unexpected("empty audio");
    }
    if (argv_template_.empty()) {
        return std::unexpected("no command configured");
    }

    auto td = TempDir::create(temp_root_, "aqc_vad_");
    if (!td) return std::unexpected(td.error());

    auto wav_path = td->path() / "vad_input.wav";
    {
        auto wav_data = wav::encode(wav::to_pcm16(samples), sample_rate);
        std::ofstream out(wav_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(wav_data.data()),
                  static_cast<std::streamsize>(wav_data.size()));
        if (!out) return std::unexpected("failed to write " + wav_path.string());
    }

    auto proc = run_process(expand(argv_template_, wav_path.string(), device_, model_),
                            timeout_ms_);
    if (!proc) return std::unexpected(proc.error());
    if (proc->exit_code != 0) {
        return std::unexpected("command exited with code " + std::to_string(proc->exit_code) +
                               (proc->err.empty() ? "" : ": " + proc->err));
    }

    return vad::parse_segments(proc->out);
}
