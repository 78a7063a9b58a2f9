#include "qc_client.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--url URL] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  analyze FILE [--id ID]   Run quality checks on an audio file");
    std::println(stderr, "  health                   Show daemon health counters");
    std::println(stderr, "Default URL: $AUDIO_QC_URL or http://127.0.0.1:8090");
}

int main(int argc, char* argv[]) {
    std::string url = QcClient::default_url();
    std::string command;
    std::string file;
    std::string request_id;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--id" && i + 1 < argc) {
            request_id = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else if (command == "analyze" && file.empty()) {
            file = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    QcClient client(url);

    if (command == "analyze") {
        if (file.empty()) {
            usage(argv[0]);
            return 1;
        }
        auto reply = client.analyze(file, request_id);
        if (!reply) {
            std::println(stderr, "Error: {}", reply.error());
            std::println(stderr, "Is audio-qcd running at {}?", url);
            return 1;
        }
        std::println("{}", reply->dump(2));
        return reply->value("status_code", 0) == 200 ? 0 : 1;
    }

    if (command == "health") {
        auto reply = client.health();
        if (!reply) {
            std::println(stderr, "Error: {}", reply.error());
            return 1;
        }
        std::println("{}", reply->dump(2));
        return reply->value("status", "") == "healthy" ? 0 : 1;
    }

    if (!command.empty()) std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
