#include "qc_orchestrator.hpp"

#include "decode/decode_stage.hpp"
#include "metrics/clarity.hpp"
#include "metrics/clipping.hpp"
#include "metrics/silence.hpp"
#include "metrics/vad_segments.hpp"
#include "request_id.hpp"

#include <exception>
#include <format>
#include <print>

struct QcOrchestrator::Context {
    uint64_t seq = 0;
    QcRequest request;
    Reply reply;
    std::stop_source stop;

    std::shared_ptr<const DecodedAudio> audio;
    int pending = 0;
    bool finished = false;

    QcResult result;
};

namespace {

struct BasicMetrics {
    bool is_silent = false;
    ClipDetail clip;
};

} // namespace

QcOrchestrator::QcOrchestrator(const Config& config, Decoder& decoder, ThreadPool& cpu,
                               GpuGate& gpu, CompletionQueue& completions, ServiceStats& stats,
                               bool verbose)
    : config_(config), decoder_(decoder), cpu_(cpu), gpu_(gpu),
      completions_(completions), stats_(stats), verbose_(verbose) {}

QcOrchestrator::~QcOrchestrator() = default;

std::stop_source QcOrchestrator::submit(QcRequest request, Reply reply) {
    if (request.request_id.empty()) request.request_id = new_request_id();

    auto ctx = std::make_shared<Context>();
    ctx->seq = next_seq_++;
    ctx->request = std::move(request);
    ctx->reply = std::move(reply);
    auto stop = ctx->stop;

    active_.emplace(ctx->seq, ctx);
    stats_.on_queued(ctx->request.request_id);
    log(std::format("{} received, {} bytes ({})", ctx->request.request_id,
                    ctx->request.declared_size, ctx->request.filename));

    // RECEIVED -> VALIDATED
    if (auto code = check_upload(ctx->request, config_.audio_qc)) {
        fail(ctx, *code, std::string(describe(*code)));
        return stop;
    }

    start_decode(ctx);
    return stop;
}

void QcOrchestrator::cancel_all() {
    for (auto& [seq, ctx] : active_) ctx->stop.request_stop();
}

void QcOrchestrator::start_decode(const ContextPtr& ctx) {
    // VALIDATED -> DECODED, on the CPU pool
    bool queued = cpu_.submit(
        [this, ctx] {
            stats_.on_processing(ctx->request.request_id);
            std::expected<DecodedAudio, DecodeFailure> result;
            try {
                DecodeStage stage(decoder_, config_.audio_qc);
                result = stage.run(ctx->request);
            } catch (const std::exception& e) {
                result = std::unexpected(DecodeFailure{
                    .code = StatusCode::InternalError,
                    .message = std::format("decode: {}", e.what()),
                });
            }
            completions_.post([this, ctx, result = std::move(result)]() mutable {
                on_decoded(ctx, std::move(result));
            });
        },
        ctx->stop.get_token(),
        [this, ctx] { completions_.post([this, ctx] { on_cancelled(ctx); }); });

    if (!queued) fail(ctx, StatusCode::InternalError, "cpu pool is shutting down");
}

void QcOrchestrator::on_decoded(const ContextPtr& ctx,
                                std::expected<DecodedAudio, DecodeFailure> result) {
    if (settled(ctx)) return;
    if (!result) {
        fail(ctx, result.error().code, result.error().message);
        return;
    }

    log(std::format("{} decoded, {} ms", ctx->request.request_id, result->duration_ms));
    ctx->result.duration_ms = result->duration_ms;
    ctx->audio = std::make_shared<const DecodedAudio>(std::move(*result));
    ctx->request.bytes = {};
    ctx->request.bytes.shrink_to_fit();

    start_branches(ctx);
}

void QcOrchestrator::start_branches(const ContextPtr& ctx) {
    const auto& aqc = config_.audio_qc;
    auto token = ctx->stop.get_token();
    auto audio = ctx->audio;
    auto cancelled = [this, ctx] { completions_.post([this, ctx] { on_cancelled(ctx); }); };

    ctx->pending = aqc.need_clarity ? 3 : 2;

    // Silence + clipping
    bool ok = cpu_.submit(
        [this, ctx, audio] {
            const auto& aqc = config_.audio_qc;
            std::expected<BasicMetrics, std::string> out;
            try {
                BasicMetrics m;
                m.is_silent = metrics::is_silent(audio->samples, aqc.silence_dbfs);
                m.clip = metrics::detect_clipping(audio->samples, audio->sample_rate,
                                                  aqc.clipping.clip_threshold,
                                                  aqc.clipping.min_event_samples);
                out = std::move(m);
            } catch (const std::exception& e) {
                out = std::unexpected(std::format("silence/clipping: {}", e.what()));
            }
            completions_.post([this, ctx, out = std::move(out)]() mutable {
                if (settled(ctx)) return;
                if (!out) {
                    fail(ctx, StatusCode::InternalError, out.error());
                    return;
                }
                ctx->result.is_silent = out->is_silent;
                ctx->result.has_clip = out->clip.clip_count > 0;
                if (ctx->result.has_clip) ctx->result.clip_detail = std::move(out->clip);
                on_branch_done(ctx);
            });
        },
        token, cancelled);

    // Clarity
    if (ok && aqc.need_clarity) {
        ok = cpu_.submit(
            [this, ctx, audio] {
                std::expected<ClarityDetail, std::string> out;
                try {
                    out = metrics::compute_clarity(audio->samples, audio->sample_rate,
                                                   config_.audio_qc.clarity);
                } catch (const std::exception& e) {
                    out = std::unexpected(std::format("clarity: {}", e.what()));
                }
                completions_.post([this, ctx, out = std::move(out)]() mutable {
                    if (settled(ctx)) return;
                    if (!out) {
                        fail(ctx, StatusCode::InternalError, out.error());
                        return;
                    }
                    ctx->result.clarity = *out;
                    on_branch_done(ctx);
                });
            },
            token, cancelled);
    }

    // VAD, behind the GPU gate
    if (ok) {
        ok = gpu_.submit(GpuGate::Job{
            .audio = audio,
            .stop = token,
            .done = [this, ctx](VadOutcome out) {
                completions_.post([this, ctx, out = std::move(out)]() mutable {
                    if (settled(ctx)) return;
                    if (!out) {
                        fail(ctx, StatusCode::VadFailed, out.error());
                        return;
                    }
                    ctx->result.vad = metrics::build_vad_result(std::move(*out),
                                                                config_.audio_qc.merge_gap_ms);
                    on_branch_done(ctx);
                });
            },
            .cancelled = cancelled,
        });
    }

    if (!ok) fail(ctx, StatusCode::InternalError, "worker pools are shutting down");
}

bool QcOrchestrator::settled(const ContextPtr& ctx) {
    if (ctx->finished) return true;
    // Stops raised internally always follow finish(); this one came from
    // the caller.
    if (ctx->stop.stop_requested()) {
        on_cancelled(ctx);
        return true;
    }
    return false;
}

void QcOrchestrator::on_branch_done(const ContextPtr& ctx) {
    if (--ctx->pending > 0) return;

    // METRICS_DONE and VAD_DONE -> ASSEMBLED
    auto& r = ctx->result;
    r.speech_ratio = metrics::speech_ratio(r.vad.speech_ms, r.duration_ms);
    r.has_speech = r.vad.speech_ms > 0;
    finish(ctx, StatusCode::Ok);
}

void QcOrchestrator::on_cancelled(const ContextPtr& ctx) {
    if (ctx->finished) return;
    ctx->finished = true;
    ctx->stop.request_stop();
    log(ctx->request.request_id + " cancelled");
    stats_.on_finished(ctx->request.request_id, ServiceStats::Outcome::Cancelled);
    active_.erase(ctx->seq);
}

void QcOrchestrator::fail(const ContextPtr& ctx, StatusCode code, const std::string& reason) {
    if (ctx->finished) return;
    if (code == StatusCode::InternalError) {
        std::println(stderr, "qc: {} internal error: {}", ctx->request.request_id, reason);
    } else {
        log(std::format("{} failed with {}: {}", ctx->request.request_id, to_int(code), reason));
    }
    finish(ctx, code);
    // Skip sibling work that has not started yet.
    ctx->stop.request_stop();
}

void QcOrchestrator::finish(const ContextPtr& ctx, StatusCode code) {
    if (ctx->finished) return;
    ctx->finished = true;

    QcOutcome outcome{.request_id = ctx->request.request_id, .code = code, .result = std::nullopt};
    if (code == StatusCode::Ok) {
        outcome.result = std::move(ctx->result);
        log(ctx->request.request_id + " done");
    }

    stats_.on_finished(ctx->request.request_id, code == StatusCode::Ok
                                                    ? ServiceStats::Outcome::Success
                                                    : ServiceStats::Outcome::Failed);

    auto reply = std::move(ctx->reply);
    ctx->audio.reset();
    active_.erase(ctx->seq);
    if (reply) reply(std::move(outcome));
}

void QcOrchestrator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-qc] {}", msg);
    }
}
