#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "test_support.hpp"
#include "vad/command_vad_engine.hpp"
#include "vad/http_vad_engine.hpp"
#include "vad/segment_parser.hpp"

#include <httplib.h>

#include <arpa/inet.h>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using Catch::Matchers::ContainsSubstring;
using Segments = std::vector<VadSegment>;

namespace {

// Stand-in VAD server answering every POST /v1/vad with a canned reply.
struct FakeVadServer {
    struct Seen {
        std::string content_type;
        std::string filename;
        std::string file;
        std::string model;
        std::string device;
    };

    httplib::Server server;
    int port = -1;
    std::mutex mutex;
    std::optional<Seen> seen;
    std::jthread thread;

    FakeVadServer(int status, std::string content_type, std::string reply) {
        server.Post("/v1/vad", [this, status, content_type, reply](const httplib::Request& req,
                                                                    httplib::Response& res) {
            {
                std::lock_guard lock(mutex);
                auto file = req.get_file_value("file");
                seen = Seen{
                    .content_type = req.get_header_value("Content-Type"),
                    .filename = file.filename,
                    .file = file.content,
                    .model = req.get_file_value("model").content,
                    .device = req.get_file_value("device").content,
                };
            }
            res.status = status;
            res.set_content(reply, content_type);
        });
        port = server.bind_to_any_port("127.0.0.1");
        thread = std::jthread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~FakeVadServer() { server.stop(); }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port); }
};

// A loopback port nothing listens on.
uint16_t unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

} // namespace

TEST_CASE("vad::parse_segments", "[vad]") {

    SECTION("PairList") {
        auto r = vad::parse_segments("[[100, 500], [620.4, 900.6]]");
        REQUIRE(r.has_value());
        REQUIRE(*r == Segments{{100, 500}, {620, 901}});
    }

    SECTION("ModelScopeShape") {
        auto r = vad::parse_segments(R"([{"key": "audio", "value": [[10, 20], [30, 40]]}])");
        REQUIRE(r.has_value());
        REQUIRE(*r == Segments{{10, 20}, {30, 40}});
    }

    SECTION("ObjectShapes") {
        REQUIRE(*vad::parse_segments(R"({"value": [[1, 2]]})") == Segments{{1, 2}});
        REQUIRE(*vad::parse_segments(R"({"segments_ms": [[3, 4]]})") == Segments{{3, 4}});
    }

    SECTION("NoSpeech") {
        for (auto body : {"[]", "[{\"key\": \"a\", \"value\": []}]", "{\"value\": []}",
                          "{\"segments_ms\": []}"}) {
            auto r = vad::parse_segments(body);
            REQUIRE(r.has_value());
            REQUIRE(r->empty());
        }
    }

    SECTION("UnrecognisedShapeIsError") {
        for (auto body : {"{\"foo\": 1}", "{}", "null", "\"ok\"", "42", "[{\"key\": \"a\"}]",
                          "{\"value\": \"none\"}"}) {
            INFO(body);
            REQUIRE_FALSE(vad::parse_segments(body).has_value());
        }
    }

    SECTION("ServerError") {
        auto r = vad::parse_segments(R"({"error": "model not loaded"})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("model not loaded"));
    }

    SECTION("NotJson") {
        auto r = vad::parse_segments("<html>502 Bad Gateway</html>");
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("JSON"));
    }

    SECTION("MalformedPairIsError") {
        auto r = vad::parse_segments(R"([[1, 2], "x"])");
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("malformed segment"));

        for (auto body : {"[[1, 2], [3]]", R"([[1, 2], ["a", "b"]])", R"({"value": [[1, 2], null]})",
                          R"([{"value": [[1, 2, 3]]}])"}) {
            INFO(body);
            REQUIRE_FALSE(vad::parse_segments(body).has_value());
        }
    }
}

TEST_CASE("CommandVadEngine", "[vad]") {
    test::TmpDir temp_root;
    auto samples = test::sine(440.0, 0.5, 200);

    SECTION("ExpandPlaceholders") {
        auto argv = CommandVadEngine::expand(
            {"vad-cli", "--input={wav}", "--device", "{device}", "{model}", "{wav}.json"},
            "/t/in.wav", "cuda:1", "fsmn");
        REQUIRE(argv == std::vector<std::string>{
            "vad-cli", "--input=/t/in.wav", "--device", "cuda:1", "fsmn", "/t/in.wav.json"});
    }

    SECTION("ReadsSegmentsFromStdout") {
        // Succeeds only if it is handed a readable RIFF file
        test::TmpScript script(
            "[ \"$(head -c 4 \"$1\")\" = RIFF ] || exit 4\n"
            "[ \"$2\" = cpu ] || exit 5\n"
            "echo '[[0, 120], [150, 200]]'");
        CommandVadEngine engine({script.path, "{wav}", "{device}"}, "fsmn", "cpu",
                                temp_root.path.string(), 5000);

        auto r = engine.detect(samples, kTargetSampleRate);
        REQUIRE(r.has_value());
        REQUIRE(*r == Segments{{0, 120}, {150, 200}});
        REQUIRE(temp_root.entry_count() == 0);
    }

    SECTION("NonZeroExitIsError") {
        test::TmpScript script("echo 'CUDA out of memory' >&2\nexit 2");
        CommandVadEngine engine({script.path, "{wav}"}, "fsmn", "cpu", temp_root.path.string(), 5000);

        auto r = engine.detect(samples, kTargetSampleRate);
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("code 2"));
        REQUIRE_THAT(r.error(), ContainsSubstring("CUDA out of memory"));
        REQUIRE(temp_root.entry_count() == 0);
    }

    SECTION("GarbageOutputIsError") {
        test::TmpScript script("echo 'loading model...'");
        CommandVadEngine engine({script.path}, "fsmn", "cpu", temp_root.path.string(), 5000);
        REQUIRE_FALSE(engine.detect(samples, kTargetSampleRate).has_value());
    }

    SECTION("EmptyAudioIsError") {
        CommandVadEngine engine({"true"}, "fsmn", "cpu", temp_root.path.string(), 5000);
        REQUIRE_FALSE(engine.detect({}, kTargetSampleRate).has_value());
    }
}

TEST_CASE("HttpVadEngine", "[vad]") {
    auto samples = test::sine(440.0, 0.5, 100);

    SECTION("TrailingSlashStripped") {
        HttpVadEngine engine("http://vad.local:8091//", "fsmn", "cuda:0", 5);
        REQUIRE(engine.url() == "http://vad.local:8091");
    }

    SECTION("ConnectionRefused") {
        HttpVadEngine engine("http://127.0.0.1:" + std::to_string(unused_port()), "fsmn", "cpu", 5);
        auto r = engine.detect(samples, kTargetSampleRate);
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("curl error"));
    }

    SECTION("PostsMultipartAndParsesReply") {
        FakeVadServer server(200, "application/json", R"([{"key": "audio", "value": [[30, 80]]}])");
        HttpVadEngine engine(server.url(), "fsmn", "cuda:0", 15);

        auto r = engine.detect(samples, kTargetSampleRate);
        REQUIRE(r.has_value());
        REQUIRE(*r == Segments{{30, 80}});

        std::lock_guard lock(server.mutex);
        REQUIRE(server.seen.has_value());
        REQUIRE_THAT(server.seen->content_type, ContainsSubstring("multipart/form-data"));
        REQUIRE(server.seen->filename == "audio.wav");
        REQUIRE(server.seen->file.starts_with("RIFF"));
        REQUIRE(server.seen->model == "fsmn");
        REQUIRE(server.seen->device == "cuda:0");
    }

    SECTION("HttpErrorStatus") {
        FakeVadServer server(503, "text/plain", "overloaded");
        HttpVadEngine engine(server.url(), "fsmn", "cpu", 15);

        auto r = engine.detect(samples, kTargetSampleRate);
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("HTTP 503"));
        REQUIRE_THAT(r.error(), ContainsSubstring("overloaded"));
    }

    SECTION("UnrecognisedReplyIsError") {
        FakeVadServer server(200, "application/json", R"({"status": "ok"})");
        HttpVadEngine engine(server.url(), "fsmn", "cpu", 15);

        auto r = engine.detect(samples, kTargetSampleRate);
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("unrecognised reply"));
    }
}
