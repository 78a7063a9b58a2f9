#pragma once

#include <string_view>

// Business-level outcome of one QC request. Everything except Ok and
// InternalError is reported in-band with HTTP 200.
enum class StatusCode : int {
    Ok = 200,

    // Input
    MissingAudio = 1001,        // no file, or an empty one
    DurationOutOfRange = 1002,  // outside [min_duration_ms, max_duration_ms]
    FileTooLarge = 1003,        // above max_file_size_mb

    // Decode / resample
    DecodeFailed = 2001,
    ResampleFailed = 2002,      // output not coercible to mono 16 kHz
    InvalidAudio = 2003,        // empty or non-finite samples

    // Processing
    VadFailed = 3001,

    // Contract violation inside the service, never a user-facing code.
    InternalError = 500,
};

constexpr int to_int(StatusCode code) { return static_cast<int>(code); }

constexpr std::string_view describe(StatusCode code) {
    switch (code) {
        case StatusCode::Ok: return "ok";
        case StatusCode::MissingAudio: return "missing or empty file";
        case StatusCode::DurationOutOfRange: return "duration out of range";
        case StatusCode::FileTooLarge: return "file too large";
        case StatusCode::DecodeFailed: return "decode failed";
        case StatusCode::ResampleFailed: return "resample to mono 16k failed";
        case StatusCode::InvalidAudio: return "invalid decoded samples";
        case StatusCode::VadFailed: return "vad inference failed";
        case StatusCode::InternalError: return "internal error";
    }
    return "unknown";
}
