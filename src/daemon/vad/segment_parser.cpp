#include "vad/segment_parser.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vad {

namespace {

constexpr size_t kMaxQuoted = 120;

bool is_pair(const json& p) {
    return p.is_array() && p.size() == 2 && p[0].is_number() && p[1].is_number();
}

std::string quote(const json& v) {
    auto s = v.dump();
    if (s.size() > kMaxQuoted) s = s.substr(0, kMaxQuoted) + "...";
    return s;
}

std::expected<std::vector<VadSegment>, std::string> to_segments(const json& list) {
    if (!list.is_array()) {
        return std::unexpected("segment list is not an array: " + quote(list));
    }
    std::vector<VadSegment> out;
    out.reserve(list.size());
    for (auto& p : list) {
        if (!is_pair(p)) return std::unexpected("malformed segment: " + quote(p));
        out.push_back({
            .start_ms = std::llround(p[0].get<double>()),
            .end_ms = std::llround(p[1].get<double>()),
        });
    }
    return out;
}

} // namespace

std::expected<std::vector<VadSegment>, std::string> parse_segments(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }

    if (j.is_array()) {
        if (j.empty() || !j[0].is_object()) return to_segments(j);

        auto& first = j[0];
        if (!first.contains("value")) {
            return std::unexpected("reply entry has no \"value\": " + quote(first));
        }
        return to_segments(first["value"]);
    }

    if (j.is_object()) {
        if (j.contains("error")) {
            auto& e = j["error"];
            return std::unexpected("server error: " + (e.is_string() ? e.get<std::string>() : e.dump()));
        }
        for (const char* key : {"value", "segments_ms"}) {
            if (j.contains(key)) return to_segments(j[key]);
        }
    }

    return std::unexpected("unrecognised reply: " + quote(j));
}

} // namespace vad
