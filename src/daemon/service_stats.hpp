#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Request lifecycle counters for the health endpoint. Thread-safe; one
// instance per process, handed to whoever records transitions.
class ServiceStats {
public:
    using Clock = std::chrono::system_clock;

    enum class Outcome { Success, Failed, Cancelled };

    struct Snapshot {
        std::string start_time; // local time, "%Y-%m-%d %H:%M:%S"
        int64_t uptime_seconds = 0;
        std::string uptime_formatted;
        uint64_t total_requests = 0;
        uint64_t success_count = 0;
        uint64_t failed_count = 0;
        uint64_t cancelled_count = 0;
        std::vector<std::string> processing_ids; // sorted
        std::vector<std::string> queued_ids;     // sorted
    };

    explicit ServiceStats(Clock::time_point start = Clock::now());

    void on_queued(const std::string& id);
    void on_processing(const std::string& id);
    void on_finished(const std::string& id, Outcome outcome);

    Snapshot snapshot(Clock::time_point now = Clock::now()) const;

    // "1d 2h 3m 4s"; zero day/hour/minute parts are omitted, seconds never are.
    static std::string format_uptime(int64_t seconds);
    static std::string format_local_time(Clock::time_point tp);

private:
    Clock::time_point start_;

    mutable std::mutex mutex_;
    uint64_t total_ = 0;
    uint64_t success_ = 0;
    uint64_t failed_ = 0;
    uint64_t cancelled_ = 0;
    std::set<std::string> processing_;
    std::set<std::string> queued_;
};
