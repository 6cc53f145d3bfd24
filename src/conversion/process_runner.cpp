#include "conversion/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace docgate::conversion {

using core::errors::ErrorKind;
using core::errors::GatewayError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// Negative pid addresses the whole process group led by the child.
void kill_group(const pid_t pid) {
    static_cast<void>(kill(-pid, SIGKILL));
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessSpec& spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return GatewayError{ErrorKind::Internal, "Process argv is empty.",
                            "empty_argv"};
    }

    // execv wants mutable strings; keep private copies alive until it runs.
    std::vector<std::string> arg_storage = spec.argv;
    std::vector<char*> argv;
    argv.reserve(arg_storage.size() + 1);
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return GatewayError{ErrorKind::Internal, "Failed to create process pipes.",
                            "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return GatewayError{ErrorKind::Internal, "Failed to fork process.",
                            "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(spec.working_directory.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        execv(argv[0], argv.data());
        _exit(127);
    }

    // Set from both sides so kill(-pid) is valid whichever runs first.
    static_cast<void>(setpgid(pid, pid));

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool group_reaped = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - started)
                                 .count();
        if (!group_reaped && elapsed >= static_cast<std::int64_t>(spec.timeout_ms)) {
            capture.timed_out = true;
            kill_group(pid);
            group_reaped = true;
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
            static_cast<void>(poll(fds, nfds, 20));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // Helpers left behind by the child may still hold the pipes open.
        if (child_exited && !group_reaped) {
            kill_group(pid);
            group_reaped = true;
        }

        if (child_exited && !stdout_open && !stderr_open) {
            break;
        }
        if (!child_exited && nfds == 0) {
            static_cast<void>(poll(nullptr, 0, 20));
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

std::string tail_excerpt(const std::string& text, const std::size_t max_bytes) {
    std::string excerpt =
        text.size() <= max_bytes ? text : "..." + text.substr(text.size() - max_bytes);
    while (!excerpt.empty() &&
           (excerpt.back() == '\n' || excerpt.back() == '\r' || excerpt.back() == ' ')) {
        excerpt.pop_back();
    }
    return excerpt;
}

}  // namespace docgate::conversion
