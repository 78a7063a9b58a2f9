#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "qc_orchestrator.hpp"
#include "test_support.hpp"
#include "vad/segment_parser.hpp"

#include <latch>
#include <optional>

using Catch::Matchers::WithinAbs;
using test::FakeVadEngine;

namespace {

Config test_config() {
    Config cfg;
    cfg.audio_qc.min_duration_ms = 500;
    cfg.audio_qc.max_duration_ms = 10000;
    cfg.audio_qc.max_file_size_mb = 1;
    cfg.audio_qc.merge_gap_ms = 10;
    return cfg;
}

// Everything one orchestrator needs, torn down in dependency order.
struct Harness {
    Config cfg = test_config();
    std::shared_ptr<FakeVadEngine::Shared> vad_shared = std::make_shared<FakeVadEngine::Shared>();
    FakeVadEngine* vad = nullptr;
    test::FakeDecoder decoder;
    CompletionQueue completions{nullptr};
    ServiceStats stats;
    ThreadPool cpu{2};
    std::unique_ptr<GpuGate> gpu;
    std::unique_ptr<QcOrchestrator> orch;

    Harness() {
        std::vector<std::unique_ptr<VadEngine>> engines;
        auto engine = std::make_unique<FakeVadEngine>(vad_shared);
        vad = engine.get();
        engines.push_back(std::move(engine));
        gpu = std::make_unique<GpuGate>(1, std::move(engines));
        orch = std::make_unique<QcOrchestrator>(cfg, decoder, cpu, *gpu, completions, stats);
    }

    // Workers may still be running branches of a request that already
    // failed; they must finish before the orchestrator goes away.
    ~Harness() {
        FakeVadEngine::release(*vad_shared);
        cpu.shutdown();
        gpu.reset();
        orch.reset();
    }

    // Submits and pumps completions until the reply arrives.
    std::optional<QcOutcome> run(QcRequest req) {
        std::optional<QcOutcome> out;
        orch->submit(std::move(req), [&](QcOutcome o) { out = std::move(o); });
        test::eventually([&] {
            completions.drain();
            return out.has_value();
        });
        return out;
    }
};

} // namespace

TEST_CASE("QcOrchestrator", "[orchestrator]") {
    Harness h;

    SECTION("FullResult") {
        auto out = h.run(test::make_request());
        REQUIRE(out.has_value());
        REQUIRE(out->code == StatusCode::Ok);
        REQUIRE(out->request_id == "req-1");
        REQUIRE(out->result.has_value());

        auto& r = *out->result;
        REQUIRE(r.duration_ms == 1000);
        REQUIRE_FALSE(r.is_silent);
        REQUIRE_FALSE(r.has_clip);
        REQUIRE_FALSE(r.clip_detail.has_value());
        REQUIRE(r.clarity.has_value());
        REQUIRE(r.clarity->clarity >= 0.0);
        REQUIRE(r.clarity->clarity <= 100.0);
        // {100,500} and {520,900} are 20 ms apart, above merge_gap_ms
        REQUIRE(r.vad.segments_ms == std::vector<VadSegment>{{100, 500}, {520, 900}});
        REQUIRE(r.vad.speech_ms == 780);
        REQUIRE(r.has_speech);
        REQUIRE_THAT(r.speech_ratio, WithinAbs(0.78, 1e-12));

        REQUIRE(h.decoder.calls == 1);
        REQUIRE(h.vad_shared->calls == 1);
        REQUIRE(h.orch->active_count() == 0);
    }

    SECTION("MergesWithinGap") {
        h.cfg.audio_qc.merge_gap_ms = 120;
        auto out = h.run(test::make_request());
        REQUIRE(out->code == StatusCode::Ok);
        REQUIRE(out->result->vad.segments_ms == std::vector<VadSegment>{{100, 900}});
        REQUIRE(out->result->vad.speech_ms == 800);
    }

    SECTION("ClippedSilenceResult") {
        std::vector<float> samples(16000, 0.0f);
        for (size_t i = 8000; i < 8050; i++) samples[i] = 1.0f;
        h.decoder.result = test::make_audio(samples);
        h.vad->reply = [] { return std::vector<VadSegment>{}; };

        auto out = h.run(test::make_request());
        REQUIRE(out->code == StatusCode::Ok);
        auto& r = *out->result;
        REQUIRE(r.has_clip);
        REQUIRE(r.clip_detail->clip_count == 1);
        REQUIRE(r.clip_detail->times_ms == std::vector<int64_t>{500});
        REQUIRE_FALSE(r.has_speech);
        REQUIRE(r.speech_ratio == 0.0);
        REQUIRE(r.vad.segments_ms.empty());
    }

    SECTION("MissingAudio") {
        auto out = h.run(test::make_request(0));
        REQUIRE(out->code == StatusCode::MissingAudio);
        REQUIRE_FALSE(out->result.has_value());
        REQUIRE(h.decoder.calls == 0);
    }

    SECTION("FileTooLargeSkipsDecoder") {
        auto req = test::make_request();
        req.declared_size = h.cfg.audio_qc.max_file_size_bytes() + 1;
        auto out = h.run(std::move(req));
        REQUIRE(out->code == StatusCode::FileTooLarge);
        REQUIRE(h.decoder.calls == 0);
        REQUIRE(h.vad_shared->calls == 0);
    }

    SECTION("DurationOutOfRangeSkipsVad") {
        h.cfg.audio_qc.min_duration_ms = 10000;
        h.decoder.result = test::make_audio(test::sine(440.0, 0.5, 5000));
        auto out = h.run(test::make_request());
        REQUIRE(out->code == StatusCode::DurationOutOfRange);
        REQUIRE(h.vad_shared->calls == 0);
    }

    SECTION("DecodeFailure") {
        h.decoder.result = std::unexpected(DecodeFailure{StatusCode::DecodeFailed, "moov atom not found"});
        auto out = h.run(test::make_request());
        REQUIRE(out->code == StatusCode::DecodeFailed);
        REQUIRE(h.vad_shared->calls == 0);
    }

    SECTION("VadFailure") {
        h.vad->reply = [] {
            return std::expected<std::vector<VadSegment>, std::string>(std::unexpected("503 from vad"));
        };
        auto out = h.run(test::make_request());
        REQUIRE(out->code == StatusCode::VadFailed);
        REQUIRE_FALSE(out->result.has_value());
    }

    SECTION("UnrecognisedVadReplyIsVadFailure") {
        h.vad->reply = [] { return vad::parse_segments(R"({"foo": 1})"); };
        auto out = h.run(test::make_request());
        REQUIRE(out->code == StatusCode::VadFailed);
        REQUIRE_FALSE(out->result.has_value());
    }

    SECTION("ClarityDisabled") {
        h.cfg.audio_qc.need_clarity = false;
        auto out = h.run(test::make_request());
        REQUIRE(out->code == StatusCode::Ok);
        REQUIRE_FALSE(out->result->clarity.has_value());
    }

    SECTION("GeneratesRequestId") {
        auto req = test::make_request();
        req.request_id.clear();
        auto out = h.run(std::move(req));
        REQUIRE(out->request_id.size() == 32);
    }

    SECTION("StatsTransitions") {
        h.run(test::make_request(1024, "ok-1"));
        h.run(test::make_request(0, "bad-1"));
        auto s = h.stats.snapshot();
        REQUIRE(s.total_requests == 2);
        REQUIRE(s.success_count == 1);
        REQUIRE(s.failed_count == 1);
        REQUIRE(s.processing_ids.empty());
        REQUIRE(s.queued_ids.empty());
    }

    SECTION("InFlightRequestShowsAsProcessing") {
        FakeVadEngine::block(*h.vad_shared);
        std::optional<QcOutcome> out;
        h.orch->submit(test::make_request(1024, "slow"), [&](QcOutcome o) { out = std::move(o); });

        REQUIRE(test::eventually([&] {
            h.completions.drain();
            std::lock_guard lock(h.vad_shared->mutex);
            return h.vad_shared->running == 1;
        }));
        auto s = h.stats.snapshot();
        REQUIRE(s.processing_ids == std::vector<std::string>{"slow"});
        REQUIRE(h.orch->active_count() == 1);

        FakeVadEngine::release(*h.vad_shared);
        REQUIRE(test::eventually([&] {
            h.completions.drain();
            return out.has_value();
        }));
        REQUIRE(out->code == StatusCode::Ok);
    }

    SECTION("CancelledWhileWaitingForGpu") {
        FakeVadEngine::block(*h.vad_shared);
        std::optional<QcOutcome> first;
        std::optional<QcOutcome> second;
        h.orch->submit(test::make_request(1024, "first"), [&](QcOutcome o) { first = std::move(o); });
        REQUIRE(test::eventually([&] {
            h.completions.drain();
            std::lock_guard lock(h.vad_shared->mutex);
            return h.vad_shared->running == 1;
        }));
        auto stop = h.orch->submit(test::make_request(1024, "second"),
                                   [&](QcOutcome o) { second = std::move(o); });

        // Wait until the second request is parked at the gate
        REQUIRE(test::eventually([&] {
            h.completions.drain();
            return h.gpu->stats().waiting == 1;
        }));
        stop.request_stop();
        FakeVadEngine::release(*h.vad_shared);

        REQUIRE(test::eventually([&] {
            h.completions.drain();
            return first.has_value() && h.orch->active_count() == 0;
        }));
        REQUIRE(first->code == StatusCode::Ok);
        REQUIRE_FALSE(second.has_value());
        REQUIRE(h.vad_shared->calls == 1);

        auto s = h.stats.snapshot();
        REQUIRE(s.cancelled_count == 1);
        REQUIRE(s.success_count == 1);
    }

    SECTION("CancelledBeforeDecode") {
        // Occupy both CPU workers so the decode task stays queued
        std::latch gate(1);
        h.cpu.submit([&] { gate.wait(); });
        h.cpu.submit([&] { gate.wait(); });

        std::optional<QcOutcome> out;
        auto stop = h.orch->submit(test::make_request(), [&](QcOutcome o) { out = std::move(o); });
        stop.request_stop();
        gate.count_down();

        REQUIRE(test::eventually([&] {
            h.completions.drain();
            return h.orch->active_count() == 0;
        }));
        REQUIRE_FALSE(out.has_value());
        REQUIRE(h.decoder.calls == 0);
        REQUIRE(h.stats.snapshot().cancelled_count == 1);
    }

    SECTION("CancelAll") {
        FakeVadEngine::block(*h.vad_shared);
        std::optional<QcOutcome> out;
        h.orch->submit(test::make_request(), [&](QcOutcome o) { out = std::move(o); });
        REQUIRE(test::eventually([&] {
            h.completions.drain();
            std::lock_guard lock(h.vad_shared->mutex);
            return h.vad_shared->running == 1;
        }));

        h.orch->cancel_all();
        FakeVadEngine::release(*h.vad_shared);
        REQUIRE(test::eventually([&] {
            h.completions.drain();
            return h.orch->active_count() == 0;
        }));
        REQUIRE_FALSE(out.has_value());
        REQUIRE(h.stats.snapshot().cancelled_count == 1);
    }
}
