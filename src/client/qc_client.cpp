#include "qc_client.hpp"

#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

QcClient::QcClient(std::string base_url, long timeout_s)
    : base_url_(std::move(base_url)), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

QcClient::~QcClient() {
    curl_global_cleanup();
}

std::string QcClient::default_url() {
    const char* env = std::getenv("AUDIO_QC_URL");
    if (env && *env) return env;
    return "http://127.0.0.1:8090";
}

std::expected<json, std::string> QcClient::analyze(const std::string& path,
                                                   const std::string& request_id) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected("not a regular file: " + path);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint = base_url_ + "/v1/audio/qc";
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, path.c_str());

    if (!request_id.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "request_id");
        curl_mime_data(part, request_id.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string response_body;
    long status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return parse_reply(response_body, status);
}

std::expected<json, std::string> QcClient::health() {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint = base_url_ + "/v1/audio/health";
    std::string response_body;
    long status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return parse_reply(response_body, status);
}

std::expected<json, std::string> QcClient::parse_reply(const std::string& body, long status) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        return std::unexpected("HTTP " + std::to_string(status) + ", unparseable body: " + e.what());
    }
}
