#pragma once

#include "config.hpp"
#include "gates/gpu_gate.hpp"
#include "gates/thread_pool.hpp"
#include "qc_types.hpp"
#include "service_stats.hpp"
#include "status_code.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Terminal state of one QC request. `result` is set iff code == Ok.
struct QcOutcome {
    std::string request_id;
    StatusCode code = StatusCode::InternalError;
    std::optional<QcResult> result;
};

namespace response {

// QcResult as the `data` object, after the need_clarity / return_segments
// shaping rules.
nlohmann::json data_json(const QcResult& result, const Config::AudioQc& cfg);

// {request_id, status_code, data}; data is {} for every code but 200.
nlohmann::json envelope(const QcOutcome& outcome, const Config::AudioQc& cfg);

// HTTP status for an envelope: 500 for InternalError, 200 otherwise.
int http_status(StatusCode code);

nlohmann::json health(const ServiceStats::Snapshot& snap, const std::string& version,
                      const ThreadPool::Stats& cpu, const GpuGate::Stats& gpu);

// Body for transport-level errors (malformed HTTP, unknown route).
nlohmann::json transport_error(int http_status, const std::string& message);

} // namespace response
