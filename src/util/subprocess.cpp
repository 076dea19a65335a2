#include "util/subprocess.hpp"
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace warden::util {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Drain a readable pipe; returns false once it reaches EOF or fails
bool drain(int fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            return false;
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            return false;
        }
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const std::string& input,
                          int timeout_ms) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe2(stdin_pipe, O_CLOEXEC) == -1 || pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        result.error = std::string("pipe failed: ") + strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    // Build argv before fork; the child must not allocate
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process; dup2 clears close-on-exec on the standard streams
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        signal(SIGPIPE, SIG_DFL);

        execvp(c_argv[0], c_argv.data());
        _exit(127);
    }

    // Parent process
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    size_t written = 0;
    if (input.empty()) {
        close_fd(in_fd);
    }

    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    while (out_fd >= 0 || err_fd >= 0) {
        struct pollfd fds[3];
        nfds_t count = 0;
        int in_slot = -1, out_slot = -1, err_slot = -1;

        if (in_fd >= 0) {
            in_slot = static_cast<int>(count);
            fds[count++] = {in_fd, POLLOUT, 0};
        }
        if (out_fd >= 0) {
            out_slot = static_cast<int>(count);
            fds[count++] = {out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            err_slot = static_cast<int>(count);
            fds[count++] = {err_fd, POLLIN, 0};
        }

        int wait_ms = -1;
        if (timeout_ms > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() <= 0) {
                spdlog::warn("{} exceeded {}ms, killing pid {}", argv[0], timeout_ms, pid);
                kill(pid, SIGKILL);
                result.timed_out = true;
                // Descendants may still hold the pipes open
                break;
            }
            wait_ms = static_cast<int>(left.count());
        }

        int ready = poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed while running {}: {}", argv[0], strerror(errno));
            break;
        }

        if (in_slot >= 0 && fds[in_slot].revents) {
            if (fds[in_slot].revents & (POLLERR | POLLHUP)) {
                close_fd(in_fd);
            } else {
                ssize_t n = write(in_fd, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == input.size()) close_fd(in_fd);
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    spdlog::debug("stdin write to {} failed: {}", argv[0], strerror(errno));
                    close_fd(in_fd);
                }
            }
        }
        if (out_slot >= 0 && fds[out_slot].revents) {
            if (!drain(out_fd, result.stdout_data)) close_fd(out_fd);
        }
        if (err_slot >= 0 && fds[err_slot].revents) {
            if (!drain(err_fd, result.stderr_data)) close_fd(err_fd);
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("waitpid failed: ") + strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.timed_out) {
        result.spawned = true;
        return result;
    }

    if (result.exit_code == 127 && result.stdout_data.empty() && result.stderr_data.empty()) {
        result.error = "failed to execute " + argv[0];
        return result;
    }

    result.spawned = true;
    return result;
}

} // namespace warden::util
