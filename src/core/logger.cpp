/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/logger.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <format>
#include <string>

#include <unistd.h>

namespace {

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    struct tm local {};
    localtime_r(&now, &local);

    char buf[32];
    std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf, len);
}

}

std::string_view log_level_label(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "INFO";
}

Logger::Logger(LogLevel min_level, const std::string& log_file)
    : min_level_(min_level), log_file_(nullptr, std::fclose), primary_(stderr), secondary_(stderr) {
    if (log_file.empty()) return;

    log_file_.reset(std::fopen(log_file.c_str(), "a"));
    if (log_file_) {
        primary_ = log_file_.get();
    } else {
        warning("Cannot open log file '{}': {}. Logging to stderr", log_file, std::strerror(errno));
    }
}

Logger::Logger(LogLevel min_level, std::FILE* primary, std::FILE* secondary)
    : min_level_(min_level), log_file_(nullptr, std::fclose), primary_(primary), secondary_(secondary) {}

void Logger::write(std::FILE* sink, std::string_view line) noexcept {
    std::fwrite(line.data(), 1, line.size(), sink);
    std::fputc('\n', sink);
    std::fflush(sink);
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!enabled(level)) return;

    std::string line = std::format(
        "{} [{}] {}: {}", timestamp(), ::getpid(), log_level_label(level), message);

    if (level >= LogLevel::Error) {
        write(secondary_, line);
        if (primary_ != secondary_) {
            write(primary_, line);
        }
    } else {
        write(primary_, line);
    }
}
