#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

// Fixed-size CPU worker pool with a FIFO queue. A task whose stop token is
// already stopped when a worker dequeues it runs `cancelled` instead of
// `work`, so it never occupies a slot.
class ThreadPool {
public:
    struct Stats {
        size_t workers = 0;
        size_t queued = 0;
        size_t in_flight = 0;
        uint64_t completed = 0;
    };

    explicit ThreadPool(size_t workers);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false once shutdown() has begun; the task is then not queued.
    bool submit(std::function<void()> work, std::stop_token stop = {},
                std::function<void()> cancelled = {});

    Stats stats() const;

    // Stop accepting, run everything already queued, join the workers.
    void shutdown();

private:
    struct Task {
        std::function<void()> work;
        std::stop_token stop;
        std::function<void()> cancelled;
    };

    void worker_loop();

    size_t workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    size_t in_flight_ = 0;
    uint64_t completed_ = 0;
    bool stopping_ = false;

    std::vector<std::jthread> threads_;
};
