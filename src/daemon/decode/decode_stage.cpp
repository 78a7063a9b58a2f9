#include "decode/decode_stage.hpp"

#include <algorithm>
#include <cmath>
#include <format>

std::optional<StatusCode> check_upload(const QcRequest& request, const Config::AudioQc& cfg) {
    if (request.bytes.empty() || request.declared_size == 0) return StatusCode::MissingAudio;
    if (request.declared_size > cfg.max_file_size_bytes()) return StatusCode::FileTooLarge;
    return std::nullopt;
}

std::optional<StatusCode> check_decoded(const DecodedAudio& audio, const Config::AudioQc& cfg) {
    if (audio.samples.empty()) return StatusCode::InvalidAudio;
    if (!std::ranges::all_of(audio.samples, [](float s) { return std::isfinite(s); })) {
        return StatusCode::InvalidAudio;
    }
    if (audio.duration_ms < cfg.min_duration_ms || audio.duration_ms > cfg.max_duration_ms) {
        return StatusCode::DurationOutOfRange;
    }
    return std::nullopt;
}

DecodeStage::DecodeStage(Decoder& decoder, const Config::AudioQc& cfg)
    : decoder_(decoder), cfg_(cfg) {}

std::expected<DecodedAudio, DecodeFailure> DecodeStage::run(const QcRequest& request) {
    if (auto code = check_upload(request, cfg_)) {
        return std::unexpected(DecodeFailure{.code = *code, .message = std::string(describe(*code))});
    }

    auto audio = decoder_.decode(request.bytes, request.filename);
    if (!audio) return std::unexpected(std::move(audio.error()));

    if (auto code = check_decoded(*audio, cfg_)) {
        std::string msg = *code == StatusCode::DurationOutOfRange
            ? std::format("duration {} ms outside [{}, {}]", audio->duration_ms,
                          cfg_.min_duration_ms, cfg_.max_duration_ms)
            : std::string(describe(*code));
        return std::unexpected(DecodeFailure{.code = *code, .message = std::move(msg)});
    }

    return audio;
}
