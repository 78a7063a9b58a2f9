#include "gates/thread_pool.hpp"

#include <exception>
#include <print>

ThreadPool::ThreadPool(size_t workers) : workers_(workers == 0 ? 1 : workers) {
    threads_.reserve(workers_);
    for (size_t i = 0; i < workers_; i++) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::submit(std::function<void()> work, std::stop_token stop,
                        std::function<void()> cancelled) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        queue_.push_back(Task{
            .work = std::move(work),
            .stop = std::move(stop),
            .cancelled = std::move(cancelled),
        });
    }
    cv_.notify_one();
    return true;
}

ThreadPool::Stats ThreadPool::stats() const {
    std::lock_guard lock(mutex_);
    return Stats{
        .workers = workers_,
        .queued = queue_.size(),
        .in_flight = in_flight_,
        .completed = completed_,
    };
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void ThreadPool::worker_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();

            if (task.stop.stop_requested()) {
                lock.unlock();
                if (task.cancelled) task.cancelled();
                continue;
            }
            in_flight_++;
        }

        try {
            task.work();
        } catch (const std::exception& e) {
            // Tasks report their own failures; reaching here is a bug in the task.
            std::println(stderr, "threadpool: task threw: {}", e.what());
        } catch (...) {
            std::println(stderr, "threadpool: task threw a non-standard exception");
        }

        {
            std::lock_guard lock(mutex_);
            in_flight_--;
            completed_++;
        }
    }
}
