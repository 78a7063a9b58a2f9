#include "service_stats.hpp"

#include <ctime>
#include <format>

ServiceStats::ServiceStats(Clock::time_point start) : start_(start) {}

void ServiceStats::on_queued(const std::string& id) {
    std::lock_guard lock(mutex_);
    total_++;
    queued_.insert(id);
}

void ServiceStats::on_processing(const std::string& id) {
    std::lock_guard lock(mutex_);
    queued_.erase(id);
    processing_.insert(id);
}

void ServiceStats::on_finished(const std::string& id, Outcome outcome) {
    std::lock_guard lock(mutex_);
    queued_.erase(id);
    processing_.erase(id);
    switch (outcome) {
        case Outcome::Success: success_++; break;
        case Outcome::Failed: failed_++; break;
        case Outcome::Cancelled: cancelled_++; break;
    }
}

ServiceStats::Snapshot ServiceStats::snapshot(Clock::time_point now) const {
    Snapshot s;
    {
        std::lock_guard lock(mutex_);
        s.total_requests = total_;
        s.success_count = success_;
        s.failed_count = failed_;
        s.cancelled_count = cancelled_;
        s.processing_ids.assign(processing_.begin(), processing_.end());
        s.queued_ids.assign(queued_.begin(), queued_.end());
    }

    auto up = std::chrono::duration_cast<std::chrono::seconds>(now - start_).count();
    s.uptime_seconds = up < 0 ? 0 : up;
    s.uptime_formatted = format_uptime(s.uptime_seconds);
    s.start_time = format_local_time(start_);
    return s;
}

std::string ServiceStats::format_uptime(int64_t seconds) {
    int64_t days = seconds / 86400;
    int64_t hours = (seconds % 86400) / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    std::string out;
    if (days > 0) out += std::format("{}d ", days);
    if (hours > 0) out += std::format("{}h ", hours);
    if (minutes > 0) out += std::format("{}m ", minutes);
    out += std::format("{}s", secs);
    return out;
}

std::string ServiceStats::format_local_time(Clock::time_point tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}
