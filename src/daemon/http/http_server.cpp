#include "http/http_server.hpp"

#include "request_id.hpp"
#include "response.hpp"

#include <charconv>
#include <exception>
#include <format>
#include <print>

namespace {

constexpr size_t kMultipartOverhead = 1024 * 1024;

constexpr const char* kQcPath = "/v1/audio/qc";
constexpr const char* kHealthPath = "/v1/audio/health";

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

std::string transport_message(int status, const httplib::Request& req) {
    switch (status) {
        case 400: return "malformed HTTP request";
        case 404: return "no route for " + req.path;
        case 413: return "request body too large";
        case 414: return "request URI too long";
        default:  return std::format("HTTP error {}", status);
    }
}

} // namespace

HttpServer::HttpServer(const Config& config, DaemonCore& core, bool verbose)
    : config_(config), core_(core), verbose_(verbose),
      body_limit_(config_.audio_qc.max_file_size_bytes() + kMultipartOverhead) {
    size_t workers = config_.server.max_connections;
    server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    // One request per connection; the reply closes it
    server_.set_keep_alive_max_count(1);
    server_.set_payload_max_length(body_limit_);

    // An oversized declared body is answered before it is read, with or
    // without Expect: 100-continue. on_error() shapes the 413.
    server_.set_expect_100_continue_handler(
        [this](const httplib::Request& req, httplib::Response& res) {
            if (!over_limit(req)) return 100;
            res.status = 413;
            return 413;
        });
    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (!over_limit(req)) return httplib::Server::HandlerResponse::Unhandled;
        res.status = 413;
        return httplib::Server::HandlerResponse::Handled;
    });

    server_.Post(kQcPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_qc(req, res);
    });
    server_.Get(kHealthPath, [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, core_.health());
    });
    server_.Get(kQcPath, [](const httplib::Request&, httplib::Response& res) {
        send_json(res, 405, response::transport_error(405, "use POST"));
    });
    server_.Post(kHealthPath, [](const httplib::Request&, httplib::Response& res) {
        send_json(res, 405, response::transport_error(405, "use GET"));
    });

    server_.set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        return on_error(req, res);
    });
    server_.set_exception_handler(
        [](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                std::println(stderr, "http: handler threw: {}", e.what());
            } catch (...) {
                std::println(stderr, "http: handler threw a non-standard exception");
            }
            send_json(res, 500, response::transport_error(500, "internal error"));
        });
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(const std::string& host, uint16_t port) {
    if (port == 0) {
        int bound = server_.bind_to_any_port(host);
        if (bound <= 0) {
            std::println(stderr, "http: cannot bind {}", host);
            return false;
        }
        port_ = static_cast<uint16_t>(bound);
    } else {
        if (!server_.bind_to_port(host, port)) {
            std::println(stderr, "http: cannot bind {}:{}", host, port);
            return false;
        }
        port_ = port;
    }

    listener_ = std::jthread([this] {
        if (!server_.listen_after_bind()) {
            std::println(stderr, "http: listener on port {} failed", port_);
        }
    });
    server_.wait_until_ready();
    return true;
}

void HttpServer::stop() {
    server_.stop();
    if (listener_.joinable()) listener_.join();
}

void HttpServer::handle_qc(const httplib::Request& req, httplib::Response& res) {
    QcRequest qc;

    // A body that is not multipart, or has no "file" part, is a request
    // without audio (1001), decided by the orchestrator like any other.
    if (req.has_file("request_id")) {
        auto id = req.get_file_value("request_id").content;
        if (is_valid_request_id(id)) qc.request_id = std::move(id);
    }
    if (req.has_file("file")) {
        auto file = req.get_file_value("file");
        qc.bytes.assign(file.content.begin(), file.content.end());
        qc.declared_size = file.content.size();
        qc.filename = file.filename;
    }

    auto outcome = core_.run_qc(std::move(qc), [&req] { return req.is_connection_closed(); });
    if (!outcome) {
        // Client gone, or the daemon is stopping
        res.set_header("Connection", "close");
        send_json(res, 503, response::transport_error(503, "request abandoned"));
        return;
    }
    send_outcome(res, *outcome);
}

httplib::Server::HandlerResponse HttpServer::on_error(const httplib::Request& req,
                                                      httplib::Response& res) {
    // Handlers that answered with an error already filled the body
    if (!res.body.empty()) return httplib::Server::HandlerResponse::Unhandled;

    if (res.status == 413 && req.method == "POST" && req.path == kQcPath) {
        send_outcome(res, core_.reject_oversized(req.get_header_value("Content-Length")));
        return httplib::Server::HandlerResponse::Handled;
    }

    log(std::format("{} {} -> {}", req.method, req.path, res.status));
    send_json(res, res.status, response::transport_error(res.status, transport_message(res.status, req)));
    return httplib::Server::HandlerResponse::Handled;
}

bool HttpServer::over_limit(const httplib::Request& req) const {
    auto value = req.get_header_value("Content-Length");
    if (value.empty()) return false;

    uint64_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec == std::errc::result_out_of_range) return true;
    return ec == std::errc{} && length > body_limit_;
}

void HttpServer::send_outcome(httplib::Response& res, const QcOutcome& outcome) const {
    send_json(res, response::http_status(outcome.code),
              response::envelope(outcome, config_.audio_qc));
}

void HttpServer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[audio-qc] {}", msg);
    }
}
