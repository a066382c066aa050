/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/shell_pipe.hpp"
#include "include/config.hpp"
#include "include/interrupts.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <format>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

int pidfd_open(pid_t pid, unsigned int flags) {
#ifdef __NR_pidfd_open
    return static_cast<int>(syscall(__NR_pidfd_open, pid, flags));
#else
    errno = ENOSYS;
    return -1;
#endif
}

// The child leads its own process group so helpers it forks die with it.
void signal_group(pid_t pid, int sig) noexcept {
    if (::kill(-pid, sig) == -1) {
        ::kill(pid, sig);
    }
}

[[noreturn]] void child_fail(int report_fd) noexcept {
    int err = errno;
    [[maybe_unused]] auto val = ::write(report_fd, &err, sizeof(err));
    ::_exit(127);
}

}

ShellPipe::ShellPipe(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("ShellPipe: Empty argument list");
    }

    std::vector<std::string> args_copy = args;
    std::vector<char*> c_args;
    c_args.reserve(args_copy.size() + 1);

    for (auto& arg : args_copy) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    PipeEnds out = make_pipe();
    PipeEnds err = make_pipe();
    PipeEnds exec_status = make_pipe();

    const int out_w = out.write.get();
    const int err_w = err.write.get();
    const int status_w = exec_status.write.get();

    pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to fork process");
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        if (::dup2(out_w, STDOUT_FILENO) == -1) child_fail(status_w);
        if (::dup2(err_w, STDERR_FILENO) == -1) child_fail(status_w);

        ::execvp(c_args[0], c_args.data());
        child_fail(status_w);
    }

    ::setpgid(pid, pid);

    out.write.reset();
    err.write.reset();
    exec_status.write.reset();

    // Closed by exec on success; carries errno when exec fails.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read.get(), &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        ::waitpid(pid, nullptr, 0);
        throw std::system_error(
            child_errno, std::generic_category(), std::format("Failed to execute '{}'", args[0]));
    }

    out_fd_ = std::move(out.read);
    err_fd_ = std::move(err.read);
    pid_ = pid;
}

ShellPipe::~ShellPipe() {
    out_fd_.reset();
    err_fd_.reset();

    if (pid_ != -1) {
        terminate();
    }
}

void ShellPipe::terminate() noexcept {
    int status;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        pid_ = -1;
        return;
    }

    signal_group(pid_, SIGTERM);

    bool reaped = false;
    int pfd = pidfd_open(pid_, 0);

    if (pfd >= 0) {
        struct pollfd pfd_struct;
        pfd_struct.fd = pfd;
        pfd_struct.events = POLLIN;

        int ret = ::poll(&pfd_struct, 1, static_cast<int>(Config::CHILD_TERM_GRACE_MS));
        ::close(pfd);

        if (ret > 0) {
            ::waitpid(pid_, &status, 0);
            reaped = true;
        }
    }

    if (!reaped) {
        for (int i = 0; i < Config::CHILD_REAP_ATTEMPTS; ++i) {
            if (::waitpid(pid_, &status, WNOHANG) == pid_) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(Config::CHILD_REAP_INTERVAL_MS));
        }

        if (!reaped) {
            signal_group(pid_, SIGKILL);
            ::waitpid(pid_, nullptr, 0);
        }
    }

    pid_ = -1;
}

ProcessResult ShellPipe::wait(std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    // Bounded so the deadline arithmetic cannot overflow the clock.
    timeout = std::min<std::chrono::milliseconds>(timeout, std::chrono::seconds(Config::MAX_TIMEOUT_SEC));
    const auto deadline = clock::now() + timeout;

    auto remaining_ms = [&]() -> int {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (left.count() <= 0) return 0;
        return static_cast<int>(std::min<long long>(left.count(), std::numeric_limits<int>::max()));
    };
    auto timeout_error = [&]() {
        return ProcessTimeout(std::format("Process did not finish within {} ms", timeout.count()));
    };

    ProcessResult result;
    std::array<char, Config::PIPE_READ_CHUNK> buffer;
    std::size_t total_read = 0;

    auto drain = [&](FileDescriptor& fd, std::string& sink) {
        ssize_t bytes_read = ::read(fd.get(), buffer.data(), buffer.size());

        if (bytes_read > 0) {
            auto count = static_cast<std::size_t>(bytes_read);
            // Past the cap the pipe is still drained so the child never blocks on it.
            if (total_read + count > Config::MAX_OUTPUT_SIZE) {
                result.truncated = true;
            } else {
                sink.append(buffer.data(), count);
                total_read += count;
            }
        } else if (bytes_read == 0) {
            fd.reset();
        } else if (errno != EINTR && errno != EAGAIN) {
            throw std::system_error(errno, std::generic_category(), "Failed to read from pipe");
        }
    };

    while (out_fd_ || err_fd_) {
        if (g_interrupted) {
            throw ProcessInterrupted("Operation interrupted by user");
        }

        int wait_ms = remaining_ms();
        if (wait_ms == 0) {
            throw timeout_error();
        }

        std::array<struct pollfd, 2> fds{};
        std::array<FileDescriptor*, 2> owners{};
        std::array<std::string*, 2> sinks{};
        nfds_t count = 0;

        if (out_fd_) {
            fds[count] = {out_fd_.get(), POLLIN, 0};
            owners[count] = &out_fd_;
            sinks[count] = &result.out;
            ++count;
        }
        if (err_fd_) {
            fds[count] = {err_fd_.get(), POLLIN, 0};
            owners[count] = &err_fd_;
            sinks[count] = &result.err;
            ++count;
        }

        int ret = ::poll(fds.data(), count, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "Failed to poll child output");
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                drain(*owners[i], *sinks[i]);
            }
        }
    }

    // Both streams are closed; the child may still be on its way out.
    int status = 0;
    while (true) {
        pid_t reaped = ::waitpid(pid_, &status, WNOHANG);
        if (reaped == pid_) break;

        if (reaped == -1) {
            if (errno == EINTR) continue;
            int saved = errno;
            pid_ = -1;
            throw std::system_error(saved, std::generic_category(), "Failed to wait for child process");
        }

        if (g_interrupted) {
            throw ProcessInterrupted("Operation interrupted by user");
        }
        if (remaining_ms() == 0) {
            throw timeout_error();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(Config::CHILD_EXIT_POLL_MS));
    }
    pid_ = -1;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    return result;
}
