#pragma once

#include <expected>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = -1; // 128 + signal number when killed by a signal
    std::string out;
    std::string err;
};

// fork/exec argv[0] (PATH lookup), stdin from /dev/null, capture stdout and
// stderr. The child is killed once timeout_ms elapses (negative: no limit).
// Errors are failures to spawn or supervise the child, not non-zero exits.
std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      int timeout_ms = -1);
