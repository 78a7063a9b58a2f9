#include "vad/vad_engine.hpp"

#include "platform/platform_paths.hpp"
#include "vad/command_vad_engine.hpp"
#include "vad/http_vad_engine.hpp"

std::unique_ptr<VadEngine> make_vad_engine(const Config& config, size_t worker_index) {
    const auto& v = config.vad;
    if (v.type == "http") {
        if (v.urls.empty()) return nullptr;
        return std::make_unique<HttpVadEngine>(v.urls[worker_index % v.urls.size()], v.model,
                                               config.audio_qc.device,
                                               static_cast<long>(v.timeout_s));
    }
    if (v.type == "command") {
        auto root = config.decoder.temp_dir.empty() ? platform::temp_dir() : config.decoder.temp_dir;
        return std::make_unique<CommandVadEngine>(v.command, v.model, config.audio_qc.device,
                                                  std::move(root),
                                                  static_cast<int>(v.timeout_s) * 1000);
    }
    return nullptr;
}
