#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_opt(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

void load_clipping(const json& c, Config::Clipping& out) {
    read_opt(c, "clip_threshold", out.clip_threshold);
    read_opt(c, "min_event_samples", out.min_event_samples);
}

void load_clarity(const json& c, Config::Clarity& out) {
    read_opt(c, "win_ms", out.win_ms);
    read_opt(c, "hop_ms", out.hop_ms);
    read_opt(c, "hf_lo_hz", out.hf_lo_hz);
    read_opt(c, "hf_hi_hz", out.hf_hi_hz);
    read_opt(c, "snr_min_db", out.snr_min_db);
    read_opt(c, "snr_max_db", out.snr_max_db);
    read_opt(c, "snr_min_db2", out.snr_min_db2);
    read_opt(c, "snr_max_db2", out.snr_max_db2);
    read_opt(c, "hf_ref", out.hf_ref);
    read_opt(c, "hf_ref2_l", out.hf_ref2_l);
    read_opt(c, "hf_ref2_h", out.hf_ref2_h);
    read_opt(c, "flat_ref", out.flat_ref);
    read_opt(c, "w_snr", out.w_snr);
    read_opt(c, "w_hf", out.w_hf);
    read_opt(c, "w_flat", out.w_flat);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            read_opt(s, "host", cfg.server.host);
            read_opt(s, "port", cfg.server.port);
            read_opt(s, "version", cfg.server.version);
            read_opt(s, "threadpool_workers", cfg.server.threadpool_workers);
            read_opt(s, "gpu_infer_concurrency", cfg.server.gpu_infer_concurrency);
            read_opt(s, "max_connections", cfg.server.max_connections);
        }

        if (j.contains("audio_qc")) {
            auto& a = j["audio_qc"];
            read_opt(a, "device", cfg.audio_qc.device);
            read_opt(a, "vad_num_workers", cfg.audio_qc.vad_num_workers);
            read_opt(a, "max_file_size_mb", cfg.audio_qc.max_file_size_mb);
            read_opt(a, "min_duration_ms", cfg.audio_qc.min_duration_ms);
            read_opt(a, "max_duration_ms", cfg.audio_qc.max_duration_ms);
            read_opt(a, "need_clarity", cfg.audio_qc.need_clarity);
            read_opt(a, "return_segments", cfg.audio_qc.return_segments);
            read_opt(a, "merge_gap_ms", cfg.audio_qc.merge_gap_ms);
            read_opt(a, "silence_dbfs", cfg.audio_qc.silence_dbfs);
            if (a.contains("clipping")) load_clipping(a["clipping"], cfg.audio_qc.clipping);
            if (a.contains("clarity")) load_clarity(a["clarity"], cfg.audio_qc.clarity);
        }

        if (j.contains("decoder")) {
            auto& d = j["decoder"];
            read_opt(d, "ffmpeg_path", cfg.decoder.ffmpeg_path);
            read_opt(d, "temp_dir", cfg.decoder.temp_dir);
            read_opt(d, "timeout_s", cfg.decoder.timeout_s);
        }

        if (j.contains("vad")) {
            auto& v = j["vad"];
            read_opt(v, "type", cfg.vad.type);
            read_opt(v, "urls", cfg.vad.urls);
            read_opt(v, "model", cfg.vad.model);
            read_opt(v, "command", cfg.vad.command);
            read_opt(v, "timeout_s", cfg.vad.timeout_s);
            read_opt(v, "warmup", cfg.vad.warmup);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::expected<void, std::string> Config::validate() const {
    auto fail = [](std::string msg) { return std::unexpected(std::move(msg)); };

    if (server.threadpool_workers == 0) return fail("server.threadpool_workers must be > 0");
    if (server.gpu_infer_concurrency == 0) return fail("server.gpu_infer_concurrency must be > 0");
    if (server.max_connections == 0) return fail("server.max_connections must be > 0");

    const auto& a = audio_qc;
    if (a.vad_num_workers == 0) return fail("audio_qc.vad_num_workers must be > 0");
    if (a.merge_gap_ms < 0) return fail("audio_qc.merge_gap_ms must be >= 0");
    if (a.max_file_size_mb == 0) return fail("audio_qc.max_file_size_mb must be > 0");
    if (a.min_duration_ms < 0 || a.max_duration_ms <= 0) {
        return fail("audio_qc min/max duration must be valid");
    }
    if (a.min_duration_ms > a.max_duration_ms) {
        return fail("audio_qc.min_duration_ms must be <= audio_qc.max_duration_ms");
    }

    if (!(a.clipping.clip_threshold > 0.0 && a.clipping.clip_threshold < 1.0)) {
        return fail("audio_qc.clipping.clip_threshold must be in (0, 1)");
    }
    if (a.clipping.min_event_samples == 0) {
        return fail("audio_qc.clipping.min_event_samples must be > 0");
    }

    const auto& c = a.clarity;
    if (c.win_ms <= 0.0 || c.hop_ms <= 0.0) return fail("audio_qc.clarity win_ms/hop_ms must be > 0");
    if (c.hf_lo_hz < 0.0 || c.hf_hi_hz <= c.hf_lo_hz) {
        return fail("audio_qc.clarity requires 0 <= hf_lo_hz < hf_hi_hz");
    }
    if (!(c.snr_min_db < c.snr_max_db && c.snr_max_db <= c.snr_min_db2 &&
          c.snr_min_db2 < c.snr_max_db2)) {
        return fail("audio_qc.clarity requires snr_min_db < snr_max_db <= snr_min_db2 < snr_max_db2");
    }
    if (!(c.hf_ref > 0.0 && c.hf_ref <= c.hf_ref2_l && c.hf_ref2_l < c.hf_ref2_h)) {
        return fail("audio_qc.clarity requires 0 < hf_ref <= hf_ref2_l < hf_ref2_h");
    }
    if (c.flat_ref <= 0.0) return fail("audio_qc.clarity.flat_ref must be > 0");
    if (c.w_snr < 0.0 || c.w_hf < 0.0 || c.w_flat < 0.0 ||
        c.w_snr + c.w_hf + c.w_flat <= 0.0) {
        return fail("audio_qc.clarity weights must be >= 0 with a positive sum");
    }

    if (decoder.ffmpeg_path.empty()) return fail("decoder.ffmpeg_path must not be empty");
    if (decoder.timeout_s == 0) return fail("decoder.timeout_s must be > 0");

    if (vad.type == "http") {
        if (vad.urls.empty()) return fail("vad.urls must not be empty for type \"http\"");
    } else if (vad.type == "command") {
        if (vad.command.empty()) return fail("vad.command must not be empty for type \"command\"");
    } else {
        return fail(std::format("unknown vad.type \"{}\"", vad.type));
    }
    if (vad.timeout_s == 0) return fail("vad.timeout_s must be > 0");

    return {};
}
