#pragma once

#include "qc_types.hpp"
#include "vad/vad_engine.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using VadOutcome = std::expected<std::vector<VadSegment>, std::string>;

// Admission gate for VAD inference: at most `permits` jobs run at once, each
// on one of a fixed set of workers that own an independent engine. Waiting
// jobs are served FIFO; a job cancelled while waiting is dropped without
// taking a permit.
class GpuGate {
public:
    struct Job {
        std::shared_ptr<const DecodedAudio> audio;
        std::stop_token stop;
        std::function<void(VadOutcome)> done; // called on the worker thread
        std::function<void()> cancelled;      // called instead of done
    };

    struct Stats {
        size_t permits = 0;
        size_t workers = 0;
        size_t in_flight = 0;
        size_t waiting = 0;
        size_t peak_in_flight = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;
    };

    GpuGate(size_t permits, std::vector<std::unique_ptr<VadEngine>> engines);
    ~GpuGate();

    GpuGate(const GpuGate&) = delete;
    GpuGate& operator=(const GpuGate&) = delete;

    // Runs every engine once on 100 ms of silence. Call before submitting.
    std::expected<void, std::string> warmup();

    bool submit(Job job);

    Stats stats() const;

    // Stop accepting, let queued jobs finish, join the workers.
    void shutdown();

private:
    void worker_loop(VadEngine& engine);

    size_t permits_;
    std::vector<std::unique_ptr<VadEngine>> engines_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> waiting_;
    size_t in_flight_ = 0;
    size_t peak_in_flight_ = 0;
    uint64_t completed_ = 0;
    uint64_t failed_ = 0;
    bool stopping_ = false;

    std::vector<std::jthread> threads_;
};
