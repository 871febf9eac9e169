#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace toolgate::tools {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

bool starts_with(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

// Pipe whose ends are not inherited across exec; dup2 in the child clears the
// flag on the copies it keeps.
bool open_pipe(int fds[2]) {
#if defined(__APPLE__)
    if (pipe(fds) != 0) {
        return false;
    }
    for (int i = 0; i < 2; ++i) {
        if (fcntl(fds[i], F_SETFD, FD_CLOEXEC) == -1) {
            return false;
        }
    }
    return true;
#else
    return pipe2(fds, O_CLOEXEC) == 0;
#endif
}

// Reads everything available. Bytes past `limit` are read and dropped so the
// writer never blocks on a full pipe.
void drain_pipe(const int fd, bool& is_open, std::string& out, const std::size_t limit,
                bool& truncated) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const std::size_t room = out.size() < limit ? limit - out.size() : 0;
            const std::size_t size = static_cast<std::size_t>(n);
            out.append(buffer, size < room ? size : room);
            if (size > room) {
                // Back to the caller so the group gets killed; later reads discard.
                truncated = true;
                return;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

}  // namespace

std::vector<std::string> sanitized_environment() {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string value(*entry);
        if (starts_with(value, "LD_") || starts_with(value, "DYLD_")) {
            continue;
        }
        env.push_back(value);
    }
    return env;
}

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    const auto& cancel_token = request.cancel_token;
    if (cancel_token && cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    // Built before fork: the child only calls async-signal-safe functions.
    const std::vector<std::string> env = sanitized_environment();
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (const auto& entry : env) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);
    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (!open_pipe(stdout_pipe) || !open_pipe(stderr_pipe)) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return GateError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return GateError{ErrorCategory::Internal, "Failed to fork process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        execle("/bin/sh", "sh", "-c", request.command.c_str(),
               static_cast<char*>(nullptr), envp.data());
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool overflow_killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        // Kill the whole group so background children release the pipes too.
        if (!capture.cancelled && !capture.timed_out && cancel_token &&
            cancel_token->load()) {
            capture.cancelled = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.cancelled && !capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text,
                   request.max_output_bytes, capture.truncated);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text,
                   request.max_output_bytes, capture.truncated);
        if (capture.truncated && !overflow_killed) {
            overflow_killed = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        if (!child_exited && waitpid(pid, &status, WNOHANG) == pid) {
            child_exited = true;
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

}  // namespace toolgate::tools
