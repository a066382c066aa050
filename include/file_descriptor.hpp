/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <utility>

class FileDescriptor {
    int fd_ = -1;

   public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd);

    ~FileDescriptor() noexcept;

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    void reset(int new_fd = -1) noexcept;

    [[nodiscard]] int get() const;

    explicit operator bool() const noexcept {
        return fd_ >= 0;
    }
};

struct PipeEnds {
    FileDescriptor read;
    FileDescriptor write;
};

// Both ends are close-on-exec; the child dup2()s the end it keeps.
[[nodiscard]] PipeEnds make_pipe();
