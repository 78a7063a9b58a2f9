#include "vad/http_vad_engine.hpp"

#include "vad/segment_parser.hpp"
#include "wav_codec.hpp"

#include <curl/curl.h>

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpVadEngine::HttpVadEngine(std::string url, std::string model, std::string device,
                             long timeout_s)
    : url_(std::move(url)), model_(std::move(model)), device_(std::move(device)),
      timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
}

HttpVadEngine::~HttpVadEngine() {
    curl_global_cleanup();
}

std::expected<std::vector<VadSegment>, std::string>
HttpVadEngine::detect(std::span<const float> samples, uint32_t sample_rate) {
    if (samples.empty()) {
        return std::unexpected("empty audio");
    }

    auto pcm = wav::to_pcm16(samples);
    auto wav_data = wav::encode(pcm, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint = url_ + "/v1/vad";
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "model");
    curl_mime_data(part, model_.c_str(), CURL_ZERO_TERMINATED);

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "device");
    curl_mime_data(part, device_.c_str(), CURL_ZERO_TERMINATED);

    std::string response_body;
    long http_status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    }

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_status != 200) {
        return std::unexpected("server returned HTTP " + std::to_string(http_status) +
                               (response_body.empty() ? "" : ": " + response_body));
    }

    return vad::parse_segments(response_body);
}
