#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Thin libcurl client for the daemon's HTTP API.
class QcClient {
public:
    explicit QcClient(std::string base_url, long timeout_s = 3600);
    ~QcClient();

    QcClient(const QcClient&) = delete;
    QcClient& operator=(const QcClient&) = delete;

    // POST /v1/audio/qc with `path` as the file part.
    std::expected<nlohmann::json, std::string> analyze(const std::string& path,
                                                       const std::string& request_id = {});

    // GET /v1/audio/health
    std::expected<nlohmann::json, std::string> health();

    // $AUDIO_QC_URL, or the daemon's default port on localhost.
    static std::string default_url();

private:
    std::expected<nlohmann::json, std::string> parse_reply(const std::string& body, long status);

    std::string base_url_;
    long timeout_s_;
};
