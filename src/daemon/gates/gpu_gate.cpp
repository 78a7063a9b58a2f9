#include "gates/gpu_gate.hpp"

#include <algorithm>
#include <exception>
#include <format>

GpuGate::GpuGate(size_t permits, std::vector<std::unique_ptr<VadEngine>> engines)
    : permits_(permits == 0 ? 1 : permits), engines_(std::move(engines)) {
    threads_.reserve(engines_.size());
    for (auto& engine : engines_) {
        threads_.emplace_back([this, &e = *engine] { worker_loop(e); });
    }
}

GpuGate::~GpuGate() {
    shutdown();
}

std::expected<void, std::string> GpuGate::warmup() {
    const std::vector<float> silence(kTargetSampleRate / 10, 0.0f);
    for (size_t i = 0; i < engines_.size(); i++) {
        VadOutcome out;
        try {
            out = engines_[i]->detect(silence, kTargetSampleRate);
        } catch (const std::exception& e) {
            out = std::unexpected(std::string(e.what()));
        }
        if (!out) return std::unexpected(std::format("vad worker {}: {}", i, out.error()));
    }
    return {};
}

bool GpuGate::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        waiting_.push_back(std::move(job));
    }
    cv_.notify_all();
    return true;
}

GpuGate::Stats GpuGate::stats() const {
    std::lock_guard lock(mutex_);
    return Stats{
        .permits = permits_,
        .workers = engines_.size(),
        .in_flight = in_flight_,
        .waiting = waiting_.size(),
        .peak_in_flight = peak_in_flight_,
        .completed = completed_,
        .failed = failed_,
    };
}

void GpuGate::shutdown() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void GpuGate::worker_loop(VadEngine& engine) {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] {
                return (stopping_ && waiting_.empty()) ||
                       (!waiting_.empty() && in_flight_ < permits_);
            });
            if (waiting_.empty()) return;

            job = std::move(waiting_.front());
            waiting_.pop_front();

            if (job.stop.stop_requested()) {
                lock.unlock();
                cv_.notify_all();
                if (job.cancelled) job.cancelled();
                continue;
            }

            in_flight_++;
            peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
        }

        VadOutcome out;
        try {
            out = engine.detect(job.audio->samples, job.audio->sample_rate);
        } catch (const std::exception& e) {
            out = std::unexpected(std::string("engine threw: ") + e.what());
        }

        {
            std::lock_guard lock(mutex_);
            in_flight_--;
            if (out) {
                completed_++;
            } else {
                failed_++;
            }
        }
        cv_.notify_all();

        if (job.done) job.done(std::move(out));
    }
}
