#include "daemon_core.hpp"

#include "request_id.hpp"
#include "response.hpp"

#include <chrono>
#include <condition_variable>
#include <format>
#include <print>

namespace {

// How often a waiting handler looks at its connection
constexpr auto kClientCheckInterval = std::chrono::milliseconds(50);

} // namespace

struct DaemonCore::Pending {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::optional<QcOutcome> outcome;

    // Loop thread only
    std::stop_source stop;
};

DaemonCore::DaemonCore(const Config& config, bool verbose, Decoder& decoder, ThreadPool& cpu,
                       GpuGate& gpu, CompletionQueue& completions, ServiceStats& stats)
    : config_(config), verbose_(verbose), cpu_(cpu), gpu_(gpu), completions_(completions),
      stats_(stats), orchestrator_(config_, decoder, cpu_, gpu_, completions_, stats_, verbose_) {}

DaemonCore::~DaemonCore() = default;

std::optional<QcOutcome> DaemonCore::run_qc(QcRequest request, const ClientGone& client_gone) {
    auto pending = std::make_shared<Pending>();
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return std::nullopt;
        pending_.insert(pending);

        // Posted under the lock so shutdown() cannot miss it
        completions_.post([this, pending, request = std::move(request)]() mutable {
            pending->stop = orchestrator_.submit(std::move(request), [pending](QcOutcome outcome) {
                complete(*pending, std::move(outcome));
            });
        });
    }

    bool gone = false;
    std::optional<QcOutcome> outcome;
    {
        std::unique_lock lock(pending->mutex);
        while (!pending->cv.wait_for(lock, kClientCheckInterval, [&] { return pending->done; })) {
            if (client_gone && client_gone()) {
                gone = true;
                break;
            }
        }
        if (!gone) outcome = std::move(pending->outcome);
    }

    {
        std::lock_guard lock(mutex_);
        pending_.erase(pending);
    }

    if (gone) {
        log("client disconnected, cancelling its request");
        completions_.post([pending] { pending->stop.request_stop(); });
    }
    return outcome;
}

QcOutcome DaemonCore::reject_oversized(const std::string& content_length) {
    auto id = new_request_id();
    stats_.on_queued(id);
    stats_.on_finished(id, ServiceStats::Outcome::Failed);
    log(std::format("{} rejected, Content-Length {}",
                    id, content_length.empty() ? "unknown" : content_length));

    return QcOutcome{
        .request_id = id,
        .code = StatusCode::FileTooLarge,
        .result = std::nullopt,
    };
}

nlohmann::json DaemonCore::health() const {
    return response::health(stats_.snapshot(), config_.server.version, cpu_.stats(), gpu_.stats());
}

size_t DaemonCore::pending_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

void DaemonCore::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }

    // Requests already handed over reach the orchestrator, then get cancelled
    while (completions_.drain() > 0) {}
    if (auto n = orchestrator_.active_count(); n > 0) {
        log(std::format("Cancelling {} pending request(s)", n));
    }
    orchestrator_.cancel_all();

    // Let running work finish; queued work now takes its cancellation path.
    cpu_.shutdown();
    gpu_.shutdown();
    while (completions_.drain() > 0) {}

    std::lock_guard lock(mutex_);
    for (auto& pending : pending_) complete(*pending, std::nullopt);
}

void DaemonCore::complete(Pending& pending, std::optional<QcOutcome> outcome) {
    {
        std::lock_guard lock(pending.mutex);
        if (pending.done) return;
        pending.done = true;
        pending.outcome = std::move(outcome);
    }
    pending.cv.notify_all();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-qc] {}", msg);
    }
}
