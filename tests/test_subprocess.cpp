#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "subprocess.hpp"
#include "temp_dir.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>

using Catch::Matchers::ContainsSubstring;

TEST_CASE("run_process", "[subprocess]") {

    SECTION("CapturesStdout") {
        auto r = run_process({"echo", "hello", "world"});
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 0);
        REQUIRE(r->out == "hello world\n");
        REQUIRE(r->err.empty());
    }

    SECTION("CapturesStderrAndExitCode") {
        test::TmpScript script("echo oops >&2\nexit 3");
        auto r = run_process({script.path}, 5000);
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 3);
        REQUIRE(r->err == "oops\n");
    }

    SECTION("LargeOutput") {
        // More than one pipe buffer on each stream
        test::TmpScript script(
            "i=0; while [ $i -lt 20000 ]; do echo 0123456789; echo abcdefghij >&2; i=$((i+1)); done");
        auto r = run_process({script.path}, 20000);
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 0);
        REQUIRE(r->out.size() == 20000 * 11);
        REQUIRE(r->err.size() == 20000 * 11);
    }

    SECTION("StdinIsEmpty") {
        auto r = run_process({"cat"}, 5000);
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 0);
        REQUIRE(r->out.empty());
    }

    SECTION("MissingBinaryExits127") {
        auto r = run_process({"/nonexistent/aqc-binary"});
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 127);
    }

    SECTION("Timeout") {
        test::TmpScript script("sleep 5");
        auto start = std::chrono::steady_clock::now();
        auto r = run_process({script.path}, 200);
        auto elapsed = std::chrono::steady_clock::now() - start;
        REQUIRE_FALSE(r.has_value());
        REQUIRE_THAT(r.error(), ContainsSubstring("timed out"));
        REQUIRE(elapsed < std::chrono::seconds(4));
    }

    SECTION("EmptyArgv") {
        auto r = run_process({});
        REQUIRE_FALSE(r.has_value());
    }
}

TEST_CASE("TempDir", "[subprocess]") {
    test::TmpDir root;

    SECTION("RemovedOnScopeExit") {
        std::filesystem::path p;
        {
            auto td = TempDir::create(root.path.string(), "aqc_req_");
            REQUIRE(td.has_value());
            p = td->path();
            REQUIRE(std::filesystem::is_directory(p));
            REQUIRE(p.filename().string().starts_with("aqc_req_"));
            std::ofstream(p / "payload.bin") << "data";
        }
        REQUIRE_FALSE(std::filesystem::exists(p));
        REQUIRE(root.entry_count() == 0);
    }

    SECTION("MoveKeepsOneOwner") {
        auto a = TempDir::create(root.path.string(), "aqc_req_");
        REQUIRE(a.has_value());
        auto p = a->path();
        {
            TempDir b = std::move(*a);
            REQUIRE(b.path() == p);
        }
        REQUIRE_FALSE(std::filesystem::exists(p));
    }

    SECTION("BadRoot") {
        auto td = TempDir::create("/nonexistent/aqc-root", "aqc_req_");
        REQUIRE_FALSE(td.has_value());
    }
}

TEST_CASE("safe_filename", "[subprocess]") {
    REQUIRE(safe_filename("clip.mp3") == "clip.mp3");
    REQUIRE(safe_filename("../../etc/passwd") == "passwd");
    REQUIRE(safe_filename("dir\\evil.wav").find('\\') == std::string::npos);
    REQUIRE_FALSE(safe_filename("").empty());
    REQUIRE_FALSE(safe_filename("..").empty());
    REQUIRE(safe_filename("..") != "..");
}
