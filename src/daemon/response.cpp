#include "response.hpp"

#include "metrics/vad_segments.hpp"

using json = nlohmann::json;

namespace response {

namespace {

constexpr int kDecimals = 4;

json clarity_detail_json(const ClarityDetail& c) {
    return {
        {"snr_db", metrics::round_to(c.snr_db, kDecimals)},
        {"hf_ratio", metrics::round_to(c.hf_ratio, kDecimals)},
        {"spectral_flatness", metrics::round_to(c.spectral_flatness, kDecimals)},
        {"snr_score", metrics::round_to(c.snr_score, kDecimals)},
        {"hf_score", metrics::round_to(c.hf_score, kDecimals)},
        {"flat_score", metrics::round_to(c.flat_score, kDecimals)},
    };
}

} // namespace

json data_json(const QcResult& r, const Config::AudioQc& cfg) {
    json data = {
        {"is_silent", r.is_silent},
        {"has_speech", r.has_speech},
        {"speech_ratio", metrics::round_to(r.speech_ratio, kDecimals)},
        {"has_clip", r.has_clip},
        {"clip_count", r.clip_detail ? r.clip_detail->clip_count : 0},
        {"clip_detail", nullptr},
        {"clarity", nullptr},
        {"clarity_detail", nullptr},
        {"duration_ms", r.duration_ms},
    };

    if (r.has_clip && r.clip_detail) {
        data["clip_detail"] = {
            {"clip_count", r.clip_detail->clip_count},
            {"times_ms", r.clip_detail->times_ms},
        };
    }

    if (cfg.need_clarity && r.clarity) {
        data["clarity"] = metrics::round_to(r.clarity->clarity, kDecimals);
        data["clarity_detail"] = clarity_detail_json(*r.clarity);
    }

    json segments = json::array();
    if (cfg.return_segments) {
        for (auto& s : r.vad.segments_ms) segments.push_back({s.start_ms, s.end_ms});
    }
    data["vad"] = {
        {"segments_ms", std::move(segments)},
        {"speech_ms", r.vad.speech_ms},
    };

    return data;
}

json envelope(const QcOutcome& outcome, const Config::AudioQc& cfg) {
    json data = json::object();
    if (outcome.code == StatusCode::Ok && outcome.result) {
        data = data_json(*outcome.result, cfg);
    }
    return {
        {"request_id", outcome.request_id},
        {"status_code", to_int(outcome.code)},
        {"data", std::move(data)},
    };
}

int http_status(StatusCode code) {
    return code == StatusCode::InternalError ? 500 : 200;
}

json health(const ServiceStats::Snapshot& snap, const std::string& version,
            const ThreadPool::Stats& cpu, const GpuGate::Stats& gpu) {
    return {
        {"status", "healthy"},
        {"version", version},
        {"start_time", snap.start_time},
        {"uptime_seconds", snap.uptime_seconds},
        {"uptime_formatted", snap.uptime_formatted},
        {"total_requests", snap.total_requests},
        {"success_count", snap.success_count},
        {"failed_count", snap.failed_count},
        {"cancelled_count", snap.cancelled_count},
        {"processing_count", snap.processing_ids.size()},
        {"processing_ids", snap.processing_ids},
        {"queued_count", snap.queued_ids.size()},
        {"queued_ids", snap.queued_ids},
        {"cpu_pool", {
            {"workers", cpu.workers},
            {"queued", cpu.queued},
            {"in_flight", cpu.in_flight},
            {"completed", cpu.completed},
        }},
        {"gpu_gate", {
            {"permits", gpu.permits},
            {"workers", gpu.workers},
            {"in_flight", gpu.in_flight},
            {"waiting", gpu.waiting},
            {"peak_in_flight", gpu.peak_in_flight},
            {"completed", gpu.completed},
            {"failed", gpu.failed},
        }},
    };
}

json transport_error(int http_status, const std::string& message) {
    return {{"status", "error"}, {"status_code", http_status}, {"message", message}};
}

} // namespace response
