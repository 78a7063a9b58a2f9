#pragma once

#include "decode/decoder.hpp"

#include <string>
#include <vector>

// Runs the ffmpeg CLI against a request-private temp directory:
//   ffmpeg -y -hide_banner -loglevel error -i SRC -ac 1 -ar 16000 -vn -f wav DST
class FfmpegDecoder : public Decoder {
public:
    FfmpegDecoder(std::string ffmpeg_path, std::string temp_root, int timeout_ms);

    std::expected<DecodedAudio, DecodeFailure>
        decode(std::span<const uint8_t> bytes, const std::string& filename) override;

    static std::vector<std::string> command_line(const std::string& ffmpeg_path,
                                                 const std::string& src, const std::string& dst);

private:
    std::string ffmpeg_path_;
    std::string temp_root_;
    int timeout_ms_;
};

// Mono float samples from a WAV image; the sample rate must already be
// kTargetSampleRate. Shared by every decoder that produces WAV.
std::expected<DecodedAudio, DecodeFailure> decoded_from_wav(std::span<const uint8_t> wav_bytes);
