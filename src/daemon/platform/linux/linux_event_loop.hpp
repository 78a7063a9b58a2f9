#pragma once

#include "completion_queue.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "decode/ffmpeg_decoder.hpp"
#include "gates/gpu_gate.hpp"
#include "gates/thread_pool.hpp"
#include "http/http_server.hpp"
#include "service_stats.hpp"

#include <atomic>
#include <memory>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // SIGINT/SIGTERM are read from a signalfd; every thread must have them
    // blocked, so call this before any thread is started.
    static void block_signals();

    bool init();
    void run();
    void request_stop();

    uint16_t port() const { return http_server_ ? http_server_->port() : 0; }

private:
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    FfmpegDecoder decoder_;
    ServiceStats stats_;
    CompletionQueue completions_;
    ThreadPool cpu_pool_;
    std::unique_ptr<GpuGate> gpu_gate_;

    // Pipeline entry for the HTTP handlers, created in init() once the gate exists
    std::unique_ptr<DaemonCore> core_;

    // HTTP front end, started in init() once the core exists
    std::unique_ptr<HttpServer> http_server_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
