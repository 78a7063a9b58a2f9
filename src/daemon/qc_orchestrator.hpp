#pragma once

#include "completion_queue.hpp"
#include "config.hpp"
#include "decode/decoder.hpp"
#include "gates/gpu_gate.hpp"
#include "gates/thread_pool.hpp"
#include "response.hpp"
#include "service_stats.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <unordered_map>

// Per-request pipeline:
//   RECEIVED -> VALIDATED -> DECODED -> {METRICS_DONE, VAD_DONE} -> ASSEMBLED
// with FAILED(code) reachable from every non-terminal state. All state
// transitions run on the thread that drains `completions`; the pools only
// compute and post.
class QcOrchestrator {
public:
    using Reply = std::function<void(QcOutcome)>;

    QcOrchestrator(const Config& config, Decoder& decoder, ThreadPool& cpu, GpuGate& gpu,
                   CompletionQueue& completions, ServiceStats& stats, bool verbose = false);
    ~QcOrchestrator();

    QcOrchestrator(const QcOrchestrator&) = delete;
    QcOrchestrator& operator=(const QcOrchestrator&) = delete;

    // Starts one request. `reply` runs exactly once on the loop thread, and
    // may run before submit() returns when the upload is rejected outright.
    // It does not run for a request cancelled through the returned source.
    std::stop_source submit(QcRequest request, Reply reply);

    // Cancels every request still in flight (shutdown).
    void cancel_all();

    size_t active_count() const { return active_.size(); }

private:
    struct Context;
    using ContextPtr = std::shared_ptr<Context>;

    void start_decode(const ContextPtr& ctx);
    void on_decoded(const ContextPtr& ctx, std::expected<DecodedAudio, DecodeFailure> result);
    void start_branches(const ContextPtr& ctx);
    void on_branch_done(const ContextPtr& ctx);
    void on_cancelled(const ContextPtr& ctx);
    bool settled(const ContextPtr& ctx);
    void fail(const ContextPtr& ctx, StatusCode code, const std::string& reason);
    void finish(const ContextPtr& ctx, StatusCode code);

    void log(const std::string& msg);

    const Config& config_;
    Decoder& decoder_;
    ThreadPool& cpu_;
    GpuGate& gpu_;
    CompletionQueue& completions_;
    ServiceStats& stats_;
    bool verbose_;

    uint64_t next_seq_ = 0;
    std::unordered_map<uint64_t, ContextPtr> active_;
};
