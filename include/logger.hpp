/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdio>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

enum class LogLevel { Debug = 0, Info, Warning, Error, Critical };

[[nodiscard]] std::string_view log_level_label(LogLevel level) noexcept;

/*
 * Diagnostics context for one run. Debug, Info and Warning go to the primary
 * sink; Error and Critical go to the secondary sink and are mirrored to the
 * primary one when the two differ (a log file next to stderr). stdout is
 * never a sink: it carries the plugin status line.
 */
class Logger {
    LogLevel min_level_;
    std::unique_ptr<std::FILE, int (*)(std::FILE*)> log_file_;
    std::FILE* primary_;
    std::FILE* secondary_;

    void write(std::FILE* sink, std::string_view line) noexcept;

   public:
    // Appends to `log_file` when non-empty, otherwise logs to stderr only.
    Logger(LogLevel min_level, const std::string& log_file);

    // Non-owning sinks.
    Logger(LogLevel min_level, std::FILE* primary, std::FILE* secondary);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return level >= min_level_;
    }

    void log(LogLevel level, std::string_view message);

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(LogLevel::Debug)) log(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(LogLevel::Info)) log(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void critical(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, std::format(fmt, std::forward<Args>(args)...));
    }
};
