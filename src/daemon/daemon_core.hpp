#pragma once

#include "completion_queue.hpp"
#include "config.hpp"
#include "decode/decoder.hpp"
#include "gates/gpu_gate.hpp"
#include "gates/thread_pool.hpp"
#include "qc_orchestrator.hpp"
#include "service_stats.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>

// Entry point for the HTTP handler threads. The orchestrator lives on the
// event-loop thread: run_qc() hands the request over through `completions`
// and blocks its caller until the reply comes back.
class DaemonCore {
public:
    using ClientGone = std::function<bool()>;

    DaemonCore(const Config& config, bool verbose, Decoder& decoder, ThreadPool& cpu,
               GpuGate& gpu, CompletionQueue& completions, ServiceStats& stats);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Runs one request to its outcome. `client_gone` is checked while
    // waiting; once it reports true the request is cancelled and nullopt
    // is returned. nullopt as well when the daemon is shutting down.
    std::optional<QcOutcome> run_qc(QcRequest request, const ClientGone& client_gone);

    // Outcome for an upload refused on its declared size alone (1003).
    QcOutcome reject_oversized(const std::string& content_length);

    nlohmann::json health() const;

    size_t pending_count() const;

    // Loop thread. Cancels everything in flight and releases every waiting
    // handler. Further calls are no-ops.
    void shutdown();

private:
    struct Pending;

    static void complete(Pending& pending, std::optional<QcOutcome> outcome);

    void log(const std::string& msg);

    const Config& config_;
    bool verbose_;

    ThreadPool& cpu_;
    GpuGate& gpu_;
    CompletionQueue& completions_;
    ServiceStats& stats_;

    // Loop thread only
    QcOrchestrator orchestrator_;

    mutable std::mutex mutex_;
    bool stopping_ = false;
    std::unordered_set<std::shared_ptr<Pending>> pending_;
};
