#pragma once

#include "config.hpp"
#include "daemon_core.hpp"

#include <httplib.h>

#include <cstdint>
#include <string>
#include <thread>

// HTTP front end on cpp-httplib. Connections are served by the server's
// task queue, `max_connections` threads wide, and a QC handler holds its
// thread until the orchestrator has answered.
class HttpServer {
public:
    HttpServer(const Config& config, DaemonCore& core, bool verbose = false);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and serves on a background thread; port 0 picks a free port.
    bool start(const std::string& host, uint16_t port);
    void stop();

    uint16_t port() const { return port_; }

    // Largest accepted body: the upload limit plus multipart framing.
    uint64_t body_limit() const { return body_limit_; }

private:
    void handle_qc(const httplib::Request& req, httplib::Response& res);
    httplib::Server::HandlerResponse on_error(const httplib::Request& req, httplib::Response& res);

    bool over_limit(const httplib::Request& req) const;
    void send_outcome(httplib::Response& res, const QcOutcome& outcome) const;

    void log(const std::string& msg);

    const Config& config_;
    DaemonCore& core_;
    bool verbose_;
    uint64_t body_limit_;

    httplib::Server server_;
    uint16_t port_ = 0;
    std::jthread listener_;
};
