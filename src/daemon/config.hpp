#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct Config {
    struct Server {
        std::string host = "0.0.0.0";
        uint16_t port = 8090;
        std::string version = "1.0.0";
        uint32_t threadpool_workers = 8;
        uint32_t gpu_infer_concurrency = 1;
        uint32_t max_connections = 256;
    } server;

    struct Clipping {
        double clip_threshold = 0.99;
        uint32_t min_event_samples = 10;
    };

    struct Clarity {
        double win_ms = 20.0;
        double hop_ms = 10.0;
        double hf_lo_hz = 3000.0;
        double hf_hi_hz = 8000.0;

        // SNR: 0 -> 1 over [snr_min_db, snr_max_db], 1 -> 0 over [snr_min_db2, snr_max_db2]
        double snr_min_db = -5.0;
        double snr_max_db = 10.0;
        double snr_min_db2 = 40.0;
        double snr_max_db2 = 60.0;

        // HF ratio: 0 -> 1 over [0, hf_ref], 1 -> 0 over [hf_ref2_l, hf_ref2_h]
        double hf_ref = 0.02;
        double hf_ref2_l = 0.25;
        double hf_ref2_h = 0.50;

        double flat_ref = 0.10;

        double w_snr = 0.50;
        double w_hf = 0.30;
        double w_flat = 0.20;
    };

    struct AudioQc {
        std::string device = "cuda:0";
        uint32_t vad_num_workers = 1;
        uint32_t max_file_size_mb = 300;
        int64_t min_duration_ms = 180000;  // 3 min
        int64_t max_duration_ms = 3300000; // 55 min
        bool need_clarity = true;
        bool return_segments = true;
        int64_t merge_gap_ms = 120;
        double silence_dbfs = -60.0;
        Clipping clipping;
        Clarity clarity;

        uint64_t max_file_size_bytes() const {
            return static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024;
        }
    } audio_qc;

    struct Decoder {
        std::string ffmpeg_path = "ffmpeg";
        std::string temp_dir; // empty: system temp directory
        uint32_t timeout_s = 600;
    } decoder;

    struct Vad {
        std::string type = "http"; // "http" or "command"
        std::vector<std::string> urls = {"http://localhost:8091"};
        std::string model = "iic/speech_fsmn_vad_zh-cn-16k-common-pytorch";
        // argv for type "command"; {wav}, {device} and {model} are substituted.
        std::vector<std::string> command;
        uint32_t timeout_s = 300;
        bool warmup = true;
    } vad;

    static Config load(const std::string& path);
    static Config load_default();

    std::expected<void, std::string> validate() const;
};
