/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>

#include "file_descriptor.hpp"

class ProcessTimeout : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

class ProcessInterrupted : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

struct ProcessResult {
    std::string out;
    std::string err;
    int exit_code = -1;
    int term_signal = 0;
    bool truncated = false;

    [[nodiscard]] bool succeeded() const noexcept {
        return term_signal == 0 && exit_code == 0;
    }
};

/*
 * Runs `args` (argv[0] is resolved through PATH) with stdout and stderr
 * captured on separate pipes. Exec failures surface from the constructor as
 * std::system_error carrying the child's errno, so a missing binary is
 * ENOENT. A child still running when the pipe is destroyed gets SIGTERM,
 * then SIGKILL after a grace period, and is always reaped.
 */
class ShellPipe {
    FileDescriptor out_fd_;
    FileDescriptor err_fd_;
    pid_t pid_ = -1;

    void terminate() noexcept;

   public:
    explicit ShellPipe(const std::vector<std::string>& args);

    ~ShellPipe();

    ShellPipe(const ShellPipe&) = delete;
    ShellPipe& operator=(const ShellPipe&) = delete;

    // Throws ProcessTimeout past the deadline, ProcessInterrupted on SIGINT/SIGTERM.
    ProcessResult wait(std::chrono::milliseconds timeout);

    [[nodiscard]] pid_t pid() const noexcept {
        return pid_;
    }
};
