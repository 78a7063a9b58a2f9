#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "decode/decode_stage.hpp"
#include "decode/ffmpeg_decoder.hpp"
#include "test_support.hpp"
#include "wav_codec.hpp"

#include <filesystem>
#include <fstream>
#include <limits>

using Catch::Matchers::ContainsSubstring;

namespace {

Config::AudioQc qc_config() {
    Config::AudioQc cfg;
    cfg.min_duration_ms = 500;
    cfg.max_duration_ms = 5000;
    cfg.max_file_size_mb = 1;
    return cfg;
}

// Writes a 16-bit mono WAV fixture and returns its path.
std::string write_fixture(const std::filesystem::path& dir, const std::string& name,
                          const std::vector<float>& samples, uint32_t sample_rate) {
    auto pcm = wav::to_pcm16(samples);
    auto bytes = wav::encode(pcm, sample_rate);
    auto path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return path.string();
}

// Stand-in for ffmpeg: copies `fixture` to its last argument.
std::string copy_to_last_arg(const std::string& fixture) {
    return "for last; do :; done\ncp '" + fixture + "' \"$last\"";
}

} // namespace

TEST_CASE("check_upload", "[decode]") {
    auto cfg = qc_config();

    SECTION("Accepts") {
        REQUIRE_FALSE(check_upload(test::make_request(1024), cfg).has_value());
    }

    SECTION("EmptyBytes") {
        auto req = test::make_request(0);
        REQUIRE(check_upload(req, cfg) == StatusCode::MissingAudio);
    }

    SECTION("DeclaredZero") {
        auto req = test::make_request(16);
        req.declared_size = 0;
        REQUIRE(check_upload(req, cfg) == StatusCode::MissingAudio);
    }

    SECTION("DeclaredAboveLimit") {
        auto req = test::make_request(16);
        req.declared_size = cfg.max_file_size_bytes() + 1;
        REQUIRE(check_upload(req, cfg) == StatusCode::FileTooLarge);
    }

    SECTION("ExactlyAtLimit") {
        auto req = test::make_request(16);
        req.declared_size = cfg.max_file_size_bytes();
        REQUIRE_FALSE(check_upload(req, cfg).has_value());
    }
}

TEST_CASE("check_decoded", "[decode]") {
    auto cfg = qc_config();

    SECTION("Accepts") {
        REQUIRE_FALSE(check_decoded(test::make_audio(test::sine(440.0, 0.5, 1000)), cfg).has_value());
    }

    SECTION("EmptySamples") {
        REQUIRE(check_decoded(test::make_audio({}), cfg) == StatusCode::InvalidAudio);
    }

    SECTION("NonFinite") {
        auto samples = test::sine(440.0, 0.5, 1000);
        samples[100] = std::numeric_limits<float>::quiet_NaN();
        REQUIRE(check_decoded(test::make_audio(samples), cfg) == StatusCode::InvalidAudio);
        samples[100] = std::numeric_limits<float>::infinity();
        REQUIRE(check_decoded(test::make_audio(samples), cfg) == StatusCode::InvalidAudio);
    }

    SECTION("TooShort") {
        auto audio = test::make_audio(test::sine(440.0, 0.5, 400));
        REQUIRE(check_decoded(audio, cfg) == StatusCode::DurationOutOfRange);
    }

    SECTION("TooLong") {
        auto audio = test::make_audio(test::sine(440.0, 0.5, 5001));
        REQUIRE(check_decoded(audio, cfg) == StatusCode::DurationOutOfRange);
    }

    SECTION("BoundsInclusive") {
        REQUIRE_FALSE(check_decoded(test::make_audio(test::sine(440.0, 0.5, 500)), cfg).has_value());
        REQUIRE_FALSE(check_decoded(test::make_audio(test::sine(440.0, 0.5, 5000)), cfg).has_value());
    }
}

TEST_CASE("DecodeStage", "[decode]") {
    auto cfg = qc_config();
    test::FakeDecoder decoder;
    DecodeStage stage(decoder, cfg);

    SECTION("PassesDecodedAudio") {
        auto r = stage.run(test::make_request());
        REQUIRE(r.has_value());
        REQUIRE(r->duration_ms == 1000);
        REQUIRE(decoder.calls == 1);
    }

    SECTION("MissingAudioSkipsDecoder") {
        auto r = stage.run(test::make_request(0));
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::MissingAudio);
        REQUIRE(decoder.calls == 0);
    }

    SECTION("TooLargeSkipsDecoder") {
        auto req = test::make_request();
        req.declared_size = cfg.max_file_size_bytes() + 1;
        auto r = stage.run(req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::FileTooLarge);
        REQUIRE(decoder.calls == 0);
    }

    SECTION("DecoderFailurePropagates") {
        decoder.result = std::unexpected(DecodeFailure{StatusCode::ResampleFailed, "bad rate"});
        auto r = stage.run(test::make_request());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::ResampleFailed);
        REQUIRE(r.error().message == "bad rate");
    }

    SECTION("DurationMessage") {
        decoder.result = test::make_audio(test::sine(440.0, 0.5, 200));
        auto r = stage.run(test::make_request());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::DurationOutOfRange);
        REQUIRE_THAT(r.error().message, ContainsSubstring("200 ms"));
    }

    SECTION("SilentDecodeIsValid") {
        decoder.result = test::make_audio(std::vector<float>(16000, 0.0f));
        REQUIRE(stage.run(test::make_request()).has_value());
    }
}

TEST_CASE("FfmpegDecoder", "[decode]") {
    test::TmpDir fixtures;
    test::TmpDir temp_root;
    std::vector<uint8_t> upload(256, 0x42);

    SECTION("CommandLine") {
        auto argv = FfmpegDecoder::command_line("ffmpeg", "/t/in.mp3", "/t/out.wav");
        REQUIRE(argv == std::vector<std::string>{
            "ffmpeg", "-y", "-hide_banner", "-loglevel", "error",
            "-i", "/t/in.mp3", "-ac", "1", "-ar", "16000", "-vn", "-f", "wav", "/t/out.wav"});
    }

    SECTION("DecodesToolOutput") {
        auto fixture = write_fixture(fixtures.path, "ok.wav", test::sine(440.0, 0.5, 1500), 16000);
        test::TmpScript tool(copy_to_last_arg(fixture));
        FfmpegDecoder dec(tool.path, temp_root.path.string(), 5000);

        auto r = dec.decode(upload, "clip.mp3");
        REQUIRE(r.has_value());
        REQUIRE(r->sample_rate == 16000);
        REQUIRE(r->samples.size() == 24000);
        REQUIRE(r->duration_ms == 1500);
        REQUIRE(temp_root.entry_count() == 0);
    }

    SECTION("UploadWrittenUnderItsName") {
        // Fails unless the input argument points at a file with our bytes
        auto fixture = write_fixture(fixtures.path, "ok.wav", test::sine(440.0, 0.5, 1000), 16000);
        test::TmpScript tool(
            "case \"$6\" in */clip.mp3) ;; *) exit 9 ;; esac\n"
            "[ $(wc -c < \"$6\") -eq 256 ] || exit 8\n" +
            copy_to_last_arg(fixture));
        FfmpegDecoder dec(tool.path, temp_root.path.string(), 5000);

        auto r = dec.decode(upload, "../clip.mp3");
        REQUIRE(r.has_value());
    }

    SECTION("ToolFailureIsDecodeFailed") {
        test::TmpScript tool("echo 'Invalid data found when processing input' >&2\nexit 1");
        FfmpegDecoder dec(tool.path, temp_root.path.string(), 5000);

        auto r = dec.decode(upload, "clip.mp3");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::DecodeFailed);
        REQUIRE_THAT(r.error().message, ContainsSubstring("Invalid data found"));
        REQUIRE(temp_root.entry_count() == 0);
    }

    SECTION("MissingToolIsDecodeFailed") {
        FfmpegDecoder dec("/nonexistent/ffmpeg", temp_root.path.string(), 5000);
        auto r = dec.decode(upload, "clip.mp3");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::DecodeFailed);
    }

    SECTION("NoOutputIsDecodeFailed") {
        test::TmpScript tool("exit 0");
        FfmpegDecoder dec(tool.path, temp_root.path.string(), 5000);
        auto r = dec.decode(upload, "clip.mp3");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::DecodeFailed);
    }

    SECTION("WrongRateIsResampleFailed") {
        auto fixture = write_fixture(fixtures.path, "8k.wav", test::sine(440.0, 0.5, 1000, 8000), 8000);
        test::TmpScript tool(copy_to_last_arg(fixture));
        FfmpegDecoder dec(tool.path, temp_root.path.string(), 5000);

        auto r = dec.decode(upload, "clip.mp3");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::ResampleFailed);
        REQUIRE(temp_root.entry_count() == 0);
    }

    SECTION("TimeoutIsDecodeFailed") {
        test::TmpScript tool("sleep 5");
        FfmpegDecoder dec(tool.path, temp_root.path.string(), 200);
        auto r = dec.decode(upload, "clip.mp3");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::DecodeFailed);
        REQUIRE_THAT(r.error().message, ContainsSubstring("timed out"));
    }
}

TEST_CASE("decoded_from_wav", "[decode]") {
    SECTION("NotWav") {
        std::vector<uint8_t> junk(64, 0x11);
        auto r = decoded_from_wav(junk);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StatusCode::DecodeFailed);
    }

    SECTION("DurationRounded") {
        auto pcm = wav::to_pcm16(std::vector<float>(16008, 0.1f)); // 1000.5 ms
        auto r = decoded_from_wav(wav::encode(pcm, 16000));
        REQUIRE(r.has_value());
        REQUIRE(r->duration_ms == 1001);
    }
}
