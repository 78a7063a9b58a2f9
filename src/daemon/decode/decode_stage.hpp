#pragma once

#include "config.hpp"
#include "decode/decoder.hpp"

#include <expected>
#include <optional>

// Upload checks that need no decoding: empty input (1001) and declared size
// above the limit (1003). Returns the failing code, if any.
std::optional<StatusCode> check_upload(const QcRequest& request, const Config::AudioQc& cfg);

// Decoded sample validation: empty or non-finite (2003), then duration
// limits (1002).
std::optional<StatusCode> check_decoded(const DecodedAudio& audio, const Config::AudioQc& cfg);

// Upload checks, decoder, output validation. The decoder is never invoked
// when check_upload fails.
class DecodeStage {
public:
    DecodeStage(Decoder& decoder, const Config::AudioQc& cfg);

    std::expected<DecodedAudio, DecodeFailure> run(const QcRequest& request);

private:
    Decoder& decoder_;
    const Config::AudioQc& cfg_;
};
