#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// In-memory RIFF/WAVE: 16-bit mono encode for VAD uploads, and decode of
// whatever the decode tool wrote.
namespace wav {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

struct Format {
    uint16_t audio_format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
};

struct Parsed {
    Format format;
    std::span<const uint8_t> data;
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(kFormatPcm);
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Float [-1, 1] to 16-bit PCM with saturation.
inline std::vector<int16_t> to_pcm16(std::span<const float> samples) {
    std::vector<int16_t> out(samples.size());
    for (size_t i = 0; i < samples.size(); i++) {
        double v = std::clamp(static_cast<double>(samples[i]), -1.0, 1.0);
        out[i] = static_cast<int16_t>(std::lround(v * 32767.0));
    }
    return out;
}

namespace detail {

inline uint16_t rd16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

inline uint32_t rd32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

} // namespace detail

// Walks the chunk list for "fmt " and "data". Errors mean the bytes are not a
// readable WAV file.
inline std::expected<Parsed, std::string> parse(std::span<const uint8_t> bytes) {
    using detail::rd16;
    using detail::rd32;

    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Parsed out;
    bool have_fmt = false;
    bool have_data = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        const uint8_t* hdr = bytes.data() + pos;
        uint32_t chunk_size = rd32(hdr + 4);
        size_t body = pos + 8;
        size_t remaining = bytes.size() - body;

        if (std::memcmp(hdr, "fmt ", 4) == 0) {
            if (chunk_size < 16 || chunk_size > remaining) {
                return std::unexpected("truncated fmt chunk");
            }
            const uint8_t* f = bytes.data() + body;
            out.format.audio_format = rd16(f);
            out.format.channels = rd16(f + 2);
            out.format.sample_rate = rd32(f + 4);
            out.format.bits_per_sample = rd16(f + 14);
            if (out.format.audio_format == kFormatExtensible && chunk_size >= 40) {
                // First two bytes of the SubFormat GUID carry the real format tag.
                out.format.audio_format = rd16(f + 24);
            }
            have_fmt = true;
        } else if (std::memcmp(hdr, "data", 4) == 0) {
            // Streaming writers leave 0 or 0xFFFFFFFF here; take what is present.
            size_t len = (chunk_size == 0 || chunk_size > remaining) ? remaining : chunk_size;
            out.data = bytes.subspan(body, len);
            have_data = true;
            break;
        }

        size_t advance = static_cast<size_t>(chunk_size) + (chunk_size & 1);
        if (advance > remaining) break;
        pos = body + advance;
    }

    if (!have_fmt) return std::unexpected("missing fmt chunk");
    if (!have_data) return std::unexpected("missing data chunk");
    return out;
}

// Interleaved frames of the supported encodings, averaged down to mono.
// Errors mean the format cannot be coerced to mono float.
inline std::expected<std::vector<float>, std::string> to_mono_float(const Parsed& parsed) {
    const auto& fmt = parsed.format;
    if (fmt.channels == 0) return std::unexpected("zero channels");

    size_t bytes_per_sample = fmt.bits_per_sample / 8;
    bool supported =
        (fmt.audio_format == kFormatPcm &&
         (fmt.bits_per_sample == 16 || fmt.bits_per_sample == 24 || fmt.bits_per_sample == 32)) ||
        (fmt.audio_format == kFormatFloat && fmt.bits_per_sample == 32);
    if (!supported) {
        return std::unexpected("unsupported sample format " + std::to_string(fmt.audio_format) +
                               "/" + std::to_string(fmt.bits_per_sample) + "bit");
    }

    size_t frame_bytes = bytes_per_sample * fmt.channels;
    size_t n_frames = parsed.data.size() / frame_bytes;

    auto sample_at = [&](const uint8_t* p) -> double {
        if (fmt.audio_format == kFormatFloat) {
            float v;
            std::memcpy(&v, p, 4);
            return v;
        }
        switch (fmt.bits_per_sample) {
            case 16: {
                int16_t v;
                std::memcpy(&v, p, 2);
                return v / 32768.0;
            }
            case 24: {
                int32_t v = static_cast<int32_t>(p[0]) | (static_cast<int32_t>(p[1]) << 8) |
                            (static_cast<int32_t>(static_cast<int8_t>(p[2])) << 16);
                return v / 8388608.0;
            }
            default: {
                int32_t v;
                std::memcpy(&v, p, 4);
                return v / 2147483648.0;
            }
        }
    };

    std::vector<float> out(n_frames);
    const uint8_t* p = parsed.data.data();
    for (size_t i = 0; i < n_frames; i++) {
        double acc = 0.0;
        for (uint16_t c = 0; c < fmt.channels; c++) {
            acc += sample_at(p);
            p += bytes_per_sample;
        }
        out[i] = static_cast<float>(acc / fmt.channels);
    }
    return out;
}

} // namespace wav
