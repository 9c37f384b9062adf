#include "process/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace venvbox::process {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

constexpr std::int64_t kPipeGraceMs = 2000;

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(int& fd, std::string& out, const std::size_t limit, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto room = limit > out.size() ? limit - out.size() : 0;
            const auto take = std::min(room, static_cast<std::size_t>(n));
            out.append(buffer, take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

// Parent environment with overrides applied, built before fork so the child
// does not allocate.
std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> entries;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        const std::string entry(*env);
        const auto eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        const bool overridden =
            std::any_of(overrides.begin(), overrides.end(),
                        [&key](const auto& kv) { return kv.first == key; });
        if (!overridden) {
            entries.push_back(entry);
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

ssize_t read_fully(const int fd, void* buf, const std::size_t len) {
    ssize_t n = 0;
    do {
        n = read(fd, buf, len);
    } while (n < 0 && errno == EINTR);
    return n;
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return ServiceError{ErrorCategory::Internal, "Process command cannot be empty.",
                            "empty_command"};
    }

    std::vector<std::string> args = request.argv;
    std::vector<std::string> env = build_environment(request.env_overrides);
    std::vector<char*> argv = to_c_array(args);
    std::vector<char*> envp = to_c_array(env);
    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return ServiceError{ErrorCategory::Internal,
                            "Failed to create process pipes: " + reason,
                            "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return ServiceError{ErrorCategory::Internal, "Failed to fork process: " + reason,
                            "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        int child_errno = 0;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_errno = errno;
        }
        if (child_errno == 0) {
            const int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd >= 0) {
                static_cast<void>(dup2(null_fd, STDIN_FILENO));
                static_cast<void>(close(null_fd));
            }
            static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
            static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
            environ = envp.data();
            execvp(argv[0], argv.data());
            child_errno = errno;
        }
        static_cast<void>(write(status_pipe[1], &child_errno, sizeof(child_errno)));
        _exit(127);
    }

    // Both sides call setpgid so the group exists before any kill(-pid).
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    const ssize_t status_bytes = read_fully(status_pipe[0], &child_errno, sizeof(child_errno));
    close_fd(status_pipe[0]);
    if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return ServiceError{ErrorCategory::Execution,
                            "Failed to start " + request.argv.front() + ": " +
                                std::strerror(child_errno),
                            "spawn_failed"};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool child_exited = false;
    int status = 0;

    while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0 || !child_exited) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed >= static_cast<std::int64_t>(request.timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }
        // A process that left the group can keep the pipes open forever.
        if (capture.timed_out && child_exited &&
            elapsed >= static_cast<std::int64_t>(request.timeout_ms) + kPipeGraceMs) {
            close_fd(stdout_pipe[0]);
            close_fd(stderr_pipe[0]);
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        for (const int fd : {stdout_pipe[0], stderr_pipe[0]}) {
            if (fd >= 0) {
                fds[nfds].fd = fd;
                fds[nfds].events = POLLIN;
                ++nfds;
            }
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], capture.stdout_text, request.max_output_bytes,
                   capture.stdout_truncated);
        drain_pipe(stderr_pipe[0], capture.stderr_text, request.max_output_bytes,
                   capture.stderr_truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                // Background children of the leader would hold the pipes open.
                static_cast<void>(kill(-pid, SIGKILL));
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.term_signal = WTERMSIG(status);
        capture.exit_code = 128 + capture.term_signal;
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

std::string describe_exit(const ProcessCapture& capture) {
    if (capture.term_signal != 0) {
        return "Process terminated by signal " + std::to_string(capture.term_signal);
    }
    return "Process exited with code " + std::to_string(capture.exit_code);
}

}  // namespace venvbox::process
