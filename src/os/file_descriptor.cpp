/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/file_descriptor.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

FileDescriptor::FileDescriptor(int fd) : fd_(fd) {
    if (fd_ < -1) [[unlikely]] {
        throw std::invalid_argument("Failed to wrap invalid file descriptor");
    }
}

FileDescriptor::~FileDescriptor() noexcept {
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(std::exchange(other.fd_, -1));
    }
    return *this;
}

void FileDescriptor::reset(int new_fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = new_fd;
}

int FileDescriptor::get() const {
    if (fd_ < 0) [[unlikely]] {
        throw std::logic_error("FATAL: Accessing invalid file descriptor (-1)");
    }
    return fd_;
}

PipeEnds make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to create pipe");
    }
    return PipeEnds{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}
