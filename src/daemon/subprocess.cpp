#include "subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_msg(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      int timeout_ms) {
    if (argv.empty()) return std::unexpected("empty argv");

    // Built before fork: the child may only touch async-signal-safe calls.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) return std::unexpected(errno_msg("pipe2()"));
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_msg("pipe2()");
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(msg);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_msg("fork()");
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ProcessResult result;
    pollfd fds[2] = {
        {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
    };
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool timed_out = false;

    while (open_fds > 0) {
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }

        int n = ::poll(fds, 2, wait_ms);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) continue;

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            char buf[4096];
            ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                sinks[i]->append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }

    if (timed_out) {
        ::kill(pid, SIGKILL);
        wait_child(pid);
        return std::unexpected(argv[0] + " timed out after " + std::to_string(timeout_ms) + " ms");
    }

    result.exit_code = wait_child(pid);
    if (result.exit_code < 0) return std::unexpected(errno_msg("waitpid()"));
    return result;
}
