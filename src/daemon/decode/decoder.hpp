#pragma once

#include "qc_types.hpp"
#include "status_code.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct DecodeFailure {
    StatusCode code = StatusCode::DecodeFailed;
    std::string message;
};

// Container/codec decode to mono at kTargetSampleRate. Implementations map
// tool failures onto DecodeFailed / ResampleFailed; sample validity and
// duration limits are checked by DecodeStage.
class Decoder {
public:
    virtual ~Decoder() = default;
    virtual std::expected<DecodedAudio, DecodeFailure>
        decode(std::span<const uint8_t> bytes, const std::string& filename) = 0;
};
