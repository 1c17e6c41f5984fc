// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file posix_process_runner.cpp
 * @brief fork/exec subprocess runner
 */

#include "kcenon/object_transfer/execution/process_runner.h"

#include "kcenon/object_transfer/core/logging.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kcenon::object_transfer {

namespace {

using clock = std::chrono::steady_clock;

constexpr auto poll_slice = std::chrono::milliseconds(100);

/**
 * @brief Owns one file descriptor
 */
class unique_fd {
public:
    unique_fd() = default;
    explicit unique_fd(int fd) : fd_(fd) {}
    ~unique_fd() { reset(); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;
    unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
    unique_fd& operator=(unique_fd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

    auto release() noexcept -> int {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct pipe_pair {
    unique_fd read_end;
    unique_fd write_end;
};

auto make_pipe() -> std::optional<pipe_pair> {
    int fds[2];
    if (::pipe(fds) != 0) {
        return std::nullopt;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return pipe_pair{unique_fd{fds[0]}, unique_fd{fds[1]}};
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/**
 * @brief Kills and reaps the child unless the run finished normally
 */
class child_guard {
public:
    explicit child_guard(pid_t pid) : pid_(pid) {}
    ~child_guard() {
        if (pid_ > 0) {
            ::kill(-pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
            }
        }
    }

    child_guard(const child_guard&) = delete;
    child_guard& operator=(const child_guard&) = delete;

    void release() noexcept { pid_ = -1; }

private:
    pid_t pid_;
};

/**
 * @brief Splits a byte stream into lines
 */
class line_splitter {
public:
    line_splitter(output_stream stream, const line_handler& handler)
        : stream_(stream), handler_(handler) {}

    void feed(const char* data, std::size_t size) {
        buffer_.append(data, size);
        std::size_t start = 0;
        for (auto pos = buffer_.find('\n', start); pos != std::string::npos;
             pos = buffer_.find('\n', start)) {
            emit(std::string_view(buffer_).substr(start, pos - start));
            start = pos + 1;
        }
        buffer_.erase(0, start);
    }

    void finish() {
        if (!buffer_.empty()) {
            emit(buffer_);
            buffer_.clear();
        }
    }

private:
    void emit(std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (handler_) {
            handler_(stream_, line);
        }
    }

    output_stream stream_;
    const line_handler& handler_;
    std::string buffer_;
};

[[noreturn]] void exec_child(const process_spec& spec,
                             int stdin_fd, int stdout_fd, int stderr_fd,
                             int exec_error_fd) {
    ::setpgid(0, 0);

    std::signal(SIGPIPE, SIG_DFL);

    if (::dup2(stdin_fd, STDIN_FILENO) < 0 ||
        ::dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        ::dup2(stderr_fd, STDERR_FILENO) < 0) {
        int err = errno;
        [[maybe_unused]] auto n = ::write(exec_error_fd, &err, sizeof(err));
        ::_exit(127);
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(argv[0], argv.data());

    int err = errno;
    [[maybe_unused]] auto n = ::write(exec_error_fd, &err, sizeof(err));
    ::_exit(127);
}

}  // namespace

posix_process_runner::posix_process_runner() {
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

auto posix_process_runner::run(const process_spec& spec,
                               const line_handler& on_line,
                               const cancellation_token& token)
    -> result<process_outcome> {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return unexpected{error{error_code::tool_start_failed, "empty command line"}};
    }
    const auto& program = spec.argv.front();

    auto in_pipe = make_pipe();
    auto out_pipe = make_pipe();
    auto err_pipe = make_pipe();
    auto exec_pipe = make_pipe();
    if (!in_pipe || !out_pipe || !err_pipe || !exec_pipe) {
        return unexpected{error{error_code::tool_start_failed,
            "creating pipes for " + program + ": " + std::strerror(errno)}};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return unexpected{error{error_code::tool_start_failed,
            "forking process for " + program + ": " + std::strerror(errno)}};
    }

    if (pid == 0) {
        exec_child(spec, in_pipe->read_end.get(), out_pipe->write_end.get(),
                   err_pipe->write_end.get(), exec_pipe->write_end.get());
    }

    // Parent
    ::setpgid(pid, pid);
    child_guard guard(pid);

    in_pipe->read_end.reset();
    out_pipe->write_end.reset();
    err_pipe->write_end.reset();
    exec_pipe->write_end.reset();

    // The exec pipe closes on a successful exec (CLOEXEC) or carries errno.
    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(exec_pipe->read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        auto code = exec_errno == ENOENT ? error_code::tool_not_found
                                         : error_code::tool_start_failed;
        OT_LOG_WARN(log_category::process,
                    "cannot execute " + program + ": " + std::strerror(exec_errno));
        return unexpected{error{code,
            "executing " + program + ": " + std::strerror(exec_errno)}};
    }

    OT_LOG_DEBUG(log_category::process,
                 "started " + program + " (pid " + std::to_string(pid) + ")");

    unique_fd stdin_fd = std::move(in_pipe->write_end);
    unique_fd stdout_fd = std::move(out_pipe->read_end);
    unique_fd stderr_fd = std::move(err_pipe->read_end);

    if (spec.stdin_data.empty()) {
        stdin_fd.reset();
    } else {
        set_nonblocking(stdin_fd.get());
    }

    line_splitter out_lines(output_stream::standard_output, on_line);
    line_splitter err_lines(output_stream::standard_error, on_line);

    process_outcome outcome;
    std::size_t written = 0;
    const auto started = clock::now();
    std::optional<clock::time_point> kill_deadline;
    bool killed = false;

    auto request_stop = [&](bool by_timeout) {
        if (kill_deadline) {
            return;
        }
        if (by_timeout) {
            outcome.timed_out = true;
        } else {
            outcome.cancelled = true;
        }
        ::kill(-pid, SIGTERM);
        kill_deadline = clock::now() + spec.kill_grace;
        stdin_fd.reset();
    };

    auto check_limits = [&] {
        if (token.is_cancelled()) {
            request_stop(false);
        }
        if (spec.timeout.count() > 0 && clock::now() - started >= spec.timeout) {
            request_stop(true);
        }
        if (kill_deadline && !killed && clock::now() >= *kill_deadline) {
            ::kill(-pid, SIGKILL);
            killed = true;
        }
    };

    std::array<char, 8192> buffer{};

    while (stdout_fd.valid() || stderr_fd.valid()) {
        check_limits();

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int stdin_slot = -1, stdout_slot = -1, stderr_slot = -1;

        if (stdin_fd.valid()) {
            stdin_slot = static_cast<int>(count);
            fds[count++] = pollfd{stdin_fd.get(), POLLOUT, 0};
        }
        if (stdout_fd.valid()) {
            stdout_slot = static_cast<int>(count);
            fds[count++] = pollfd{stdout_fd.get(), POLLIN, 0};
        }
        if (stderr_fd.valid()) {
            stderr_slot = static_cast<int>(count);
            fds[count++] = pollfd{stderr_fd.get(), POLLIN, 0};
        }

        int ready = ::poll(fds.data(), count, static_cast<int>(poll_slice.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return unexpected{error{error_code::internal_error,
                std::string("poll failed: ") + std::strerror(errno)}};
        }
        if (ready == 0) {
            continue;
        }

        if (stdin_slot >= 0 && fds[stdin_slot].revents != 0) {
            if (fds[stdin_slot].revents & (POLLERR | POLLHUP)) {
                stdin_fd.reset();
            } else {
                auto n = ::write(stdin_fd.get(), spec.stdin_data.data() + written,
                                 spec.stdin_data.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                    if (written == spec.stdin_data.size()) {
                        stdin_fd.reset();
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    // EPIPE: the child stopped reading; its exit status tells why.
                    stdin_fd.reset();
                }
            }
        }

        auto drain = [&](int slot, unique_fd& fd, line_splitter& lines) {
            if (slot < 0 || fds[slot].revents == 0) {
                return;
            }
            auto n = ::read(fd.get(), buffer.data(), buffer.size());
            if (n > 0) {
                lines.feed(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                lines.finish();
                fd.reset();
            }
        };
        drain(stdout_slot, stdout_fd, out_lines);
        drain(stderr_slot, stderr_fd, err_lines);
    }

    // Output is closed; the child may still be running.
    int status = 0;
    while (true) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            guard.release();
            return unexpected{error{error_code::internal_error,
                std::string("waitpid failed: ") + std::strerror(errno)}};
        }
        check_limits();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    guard.release();

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
        outcome.exit_code = 128 + outcome.term_signal;
    }

    OT_LOG_DEBUG(log_category::process,
                 program + " exited with " + std::to_string(outcome.exit_code) +
                 (outcome.timed_out ? " (timed out)" : "") +
                 (outcome.cancelled ? " (cancelled)" : ""));
    return outcome;
}

}  // namespace kcenon::object_transfer
