#include "sandbox/process_runner.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace atdd {

namespace {

constexpr int kPollIntervalMs = 50;

/// Closes both ends of a pipe on scope exit unless released.
struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        for (int& fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }
    void closeEnd(int end) {
        if (fds[end] >= 0) {
            ::close(fds[end]);
            fds[end] = -1;
        }
    }
};

/// Appends everything currently readable. Returns false once the
/// write end is closed.
bool drain(int fd, std::string& out, size_t cap, bool& truncated) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = out.size() < cap ? cap - out.size() : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            out.append(buffer, take);
            if (take < static_cast<size_t>(n)) truncated = true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ProcessRunner::ProcessRunner(LoggerPtr logger)
    : logger_(orNull(std::move(logger))) {}

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 const ProcessOptions& options,
                                 const CancellationToken* cancel) const {
    if (argv.empty()) throw InfrastructureError("empty command line");

    Pipe out_pipe, err_pipe;
    if (::pipe2(out_pipe.fds, O_CLOEXEC) != 0 || ::pipe2(err_pipe.fds, O_CLOEXEC) != 0) {
        throw InfrastructureError(std::string("pipe creation failed: ") + std::strerror(errno));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, out_pipe.fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe.fds[1], STDERR_FILENO);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) cargv.push_back(const_cast<char*>(arg.c_str()));
    cargv.push_back(nullptr);

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = 0;
    int spawn_rc = ::posix_spawnp(&pid, cargv[0], &actions, nullptr, cargv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (spawn_rc != 0) {
        throw InfrastructureError("cannot spawn '" + argv[0] + "': " + std::strerror(spawn_rc));
    }
    logger_->debug("Spawned process pid={} program={}", pid, argv[0]);

    out_pipe.closeEnd(1);
    err_pipe.closeEnd(1);
    ::fcntl(out_pipe.fds[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe.fds[0], F_SETFL, O_NONBLOCK);

    ProcessResult result;
    const bool has_deadline = options.timeout_seconds > 0.0;
    const auto deadline = start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                      std::chrono::duration<double>(options.timeout_seconds));

    bool out_open = true, err_open = true;
    bool killed = false;
    while (out_open || err_open) {
        if (isCancelled(cancel)) {
            result.cancelled = true;
            killed = true;
            break;
        }
        int wait_ms = kPollIntervalMs;
        if (has_deadline) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                result.timed_out = true;
                killed = true;
                break;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            wait_ms = static_cast<int>(std::min<long long>(wait_ms, left + 1));
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe.fds[0], POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe.fds[0], POLLIN, 0};
        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_->error("poll failed pid={} error={}", pid, std::strerror(errno));
            killed = true;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; i++) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_pipe.fds[0]) {
                out_open = drain(out_pipe.fds[0], result.stdout_text, options.max_output_bytes, result.truncated);
            } else {
                err_open = drain(err_pipe.fds[0], result.stderr_text, options.max_output_bytes, result.truncated);
            }
        }
    }

    // Both streams closed: the child is exiting, or detached its output
    // and keeps running, so the deadline still applies.
    int status = 0;
    while (!killed) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            logger_->error("waitpid failed pid={} error={}", pid, std::strerror(errno));
            killed = true;
            break;
        }
        if (isCancelled(cancel)) {
            result.cancelled = true;
            killed = true;
        } else if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            killed = true;
        } else {
            ::usleep(2000);
        }
    }

    if (killed) {
        ::kill(pid, SIGKILL);
        logger_->warn("Killed process pid={} timed_out={} cancelled={}", pid, result.timed_out, result.cancelled);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        if (out_open) drain(out_pipe.fds[0], result.stdout_text, options.max_output_bytes, result.truncated);
        if (err_open) drain(err_pipe.fds[0], result.stderr_text, options.max_output_bytes, result.truncated);
    }

    result.exit_code = decodeStatus(status);
    result.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (result.truncated) {
        logger_->warn("Process output truncated pid={} cap_bytes={}", pid, options.max_output_bytes);
    }
    return result;
}

} // namespace atdd
