#pragma once

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

// Hands continuations from pool and HTTP handler threads to the event-loop
// thread. post() is thread-safe and rings `notify` (an eventfd write in the
// daemon); the loop calls drain() when woken.
class CompletionQueue {
public:
    using NotifyCallback = std::function<void()>;

    explicit CompletionQueue(NotifyCallback notify) : notify_(std::move(notify)) {}

    void post(std::function<void()> fn) {
        {
            std::lock_guard lock(mutex_);
            pending_.push_back(std::move(fn));
        }
        if (notify_) notify_();
    }

    // Runs everything posted so far; returns how many continuations ran.
    size_t drain() {
        std::vector<std::function<void()>> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(pending_);
        }
        for (auto& fn : batch) fn();
        return batch.size();
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return pending_.empty();
    }

private:
    NotifyCallback notify_;
    mutable std::mutex mutex_;
    std::vector<std::function<void()>> pending_;
};
