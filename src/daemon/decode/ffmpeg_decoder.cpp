#include "decode/ffmpeg_decoder.hpp"

#include "subprocess.hpp"
#include "temp_dir.hpp"
#include "wav_codec.hpp"

#include <cmath>
#include <fstream>
#include <iterator>

namespace {

DecodeFailure decode_failed(std::string msg) {
    return {.code = StatusCode::DecodeFailed, .message = std::move(msg)};
}

DecodeFailure resample_failed(std::string msg) {
    return {.code = StatusCode::ResampleFailed, .message = std::move(msg)};
}

std::string last_line(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return {};
    auto start = text.find_last_of('\n', end);
    start = start == std::string::npos ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

FfmpegDecoder::FfmpegDecoder(std::string ffmpeg_path, std::string temp_root, int timeout_ms)
    : ffmpeg_path_(std::move(ffmpeg_path)), temp_root_(std::move(temp_root)),
      timeout_ms_(timeout_ms) {}

std::vector<std::string> FfmpegDecoder::command_line(const std::string& ffmpeg_path,
                                                     const std::string& src,
                                                     const std::string& dst) {
    return {
        ffmpeg_path, "-y", "-hide_banner", "-loglevel", "error",
        "-i", src,
        "-ac", "1",
        "-ar", std::to_string(kTargetSampleRate),
        "-vn",
        "-f", "wav",
        dst,
    };
}

std::expected<DecodedAudio, DecodeFailure>
FfmpegDecoder::decode(std::span<const uint8_t> bytes, const std::string& filename) {
    auto td = TempDir::create(temp_root_, "aqc_req_");
    if (!td) return std::unexpected(decode_failed(td.error()));

    constexpr std::string_view kOutputName = "input_16k_mono.wav";
    auto upload_name = safe_filename(filename);
    if (upload_name == kOutputName) upload_name = "src_" + upload_name;

    auto src = td->path() / upload_name;
    auto dst = td->path() / kOutputName;

    {
        std::ofstream out(src, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) return std::unexpected(decode_failed("failed to write " + src.string()));
    }

    auto proc = run_process(command_line(ffmpeg_path_, src.string(), dst.string()), timeout_ms_);
    if (!proc) return std::unexpected(decode_failed(proc.error()));
    if (proc->exit_code != 0) {
        auto detail = last_line(proc->err);
        return std::unexpected(decode_failed(
            "ffmpeg exited with code " + std::to_string(proc->exit_code) +
            (detail.empty() ? "" : ": " + detail)));
    }

    std::ifstream in(dst, std::ios::binary);
    if (!in.is_open()) return std::unexpected(decode_failed("ffmpeg produced no output"));
    std::vector<uint8_t> wav_bytes{std::istreambuf_iterator<char>(in),
                                   std::istreambuf_iterator<char>()};

    return decoded_from_wav(wav_bytes);
}

std::expected<DecodedAudio, DecodeFailure> decoded_from_wav(std::span<const uint8_t> wav_bytes) {
    auto parsed = wav::parse(wav_bytes);
    if (!parsed) return std::unexpected(decode_failed("unreadable output: " + parsed.error()));

    if (parsed->format.sample_rate != kTargetSampleRate) {
        return std::unexpected(resample_failed(
            "output sample rate " + std::to_string(parsed->format.sample_rate) + " Hz"));
    }

    auto samples = wav::to_mono_float(*parsed);
    if (!samples) return std::unexpected(resample_failed(samples.error()));

    DecodedAudio audio;
    audio.sample_rate = kTargetSampleRate;
    audio.duration_ms = std::llround(static_cast<double>(samples->size()) * 1000.0 /
                                     audio.sample_rate);
    audio.samples = std::move(*samples);
    return audio;
}
