/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <charconv>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

[[nodiscard]] inline std::string trim(const std::string& str) {
    return std::string(trim_sv(str));
}

// Fields are views into `text`; an empty input yields one empty field.
[[nodiscard]] inline std::vector<std::string_view> split_sv(std::string_view text, char delim) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(delim, start);
        if (pos == std::string_view::npos) {
            fields.push_back(text.substr(start));
            break;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

// First line only, without trailing whitespace. Keeps log lines single-line.
[[nodiscard]] inline std::string first_line(std::string_view msg) {
    auto nl = msg.find('\n');
    if (nl != std::string_view::npos) {
        msg = msg.substr(0, nl);
    }
    return std::string(trim_sv(msg));
}

template <typename T>
std::expected<T, std::errc> parse_number(std::string_view sv) {
    T value;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc()) {
        if (ptr == sv.data() + sv.size()) {
            return value;
        }
        return std::unexpected(std::errc::invalid_argument);
    }
    return std::unexpected(ec);
}
