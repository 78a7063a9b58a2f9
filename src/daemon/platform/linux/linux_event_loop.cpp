#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"
#include "vad/vad_engine.hpp"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

std::string temp_root(const Config& config) {
    return config.decoder.temp_dir.empty() ? platform::temp_dir() : config.decoder.temp_dir;
}

sigset_t shutdown_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    return mask;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      decoder_(config_.decoder.ffmpeg_path, temp_root(config_),
               static_cast<int>(config_.decoder.timeout_s) * 1000),
      completions_(
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }),
      cpu_pool_(config_.server.threadpool_workers) {}

LinuxEventLoop::~LinuxEventLoop() {
    // Releases handlers still waiting when run() never got to its shutdown
    if (core_) core_->shutdown();
    http_server_.reset();
    core_.reset();
    gpu_gate_.reset();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Worker notification eventfd, before anything can post
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // VAD workers, one engine each
    std::vector<std::unique_ptr<VadEngine>> engines;
    for (size_t i = 0; i < config_.audio_qc.vad_num_workers; i++) {
        auto engine = make_vad_engine(config_, i);
        if (!engine) {
            std::println(stderr, "vad: cannot create engine of type \"{}\"", config_.vad.type);
            return false;
        }
        engines.push_back(std::move(engine));
    }
    gpu_gate_ = std::make_unique<GpuGate>(config_.server.gpu_infer_concurrency, std::move(engines));

    if (config_.vad.warmup) {
        log(std::format("Warming up {} VAD worker(s)...", config_.audio_qc.vad_num_workers));
        auto warm = gpu_gate_->warmup();
        if (!warm) {
            std::println(stderr, "vad: warmup failed: {}", warm.error());
            return false;
        }
        log("VAD warmup done");
    }

    core_ = std::make_unique<DaemonCore>(config_, verbose_, decoder_, cpu_pool_, *gpu_gate_,
                                         completions_, stats_);

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    block_signals();
    sigset_t mask = shutdown_signals();

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(worker_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    // HTTP listener, last: its handlers post to the loop
    http_server_ = std::make_unique<HttpServer>(config_, *core_, verbose_);
    if (!http_server_->start(config_.server.host, config_.server.port)) return false;
    log(std::format("HTTP listening on {}:{}", config_.server.host, http_server_->port()));

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 64;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                while (::read(worker_event_fd_, &val, sizeof(val)) > 0) {}
                completions_.drain();
            }
        }
    }

    // Clean shutdown: cancel the pipeline, release waiting handlers with a
    // 503, then close the listener
    if (core_) core_->shutdown();
    if (http_server_) http_server_->stop();
}

void LinuxEventLoop::block_signals() {
    sigset_t mask = shutdown_signals();
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    uint64_t val = 1;
    if (worker_event_fd_ >= 0 && ::write(worker_event_fd_, &val, sizeof(val)) < 0) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-qc] {}", msg);
    }
}
