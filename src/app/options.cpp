/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/options.hpp"

#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "include/utils.hpp"

ToolProfile CheckOptions::tool_profile() const {
    if (tool == "ookla") {
        return ToolProfile::ookla(server_id);
    }
    return ToolProfile::speedtest_cli(server_id);
}

std::expected<CheckOptions, std::string> parse_options(int argc, const char* const argv[]) {
    CheckOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::string_view name = arg;
        std::optional<std::string_view> inline_value;

        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
        }

        auto take_value = [&]() -> std::expected<std::string_view, std::string> {
            if (inline_value) return *inline_value;
            if (i + 1 >= argc) {
                return std::unexpected(std::format("Option '{}' requires a value", name));
            }
            return std::string_view(argv[++i]);
        };

        auto take_int = [&](int& dest) -> std::expected<void, std::string> {
            auto value = take_value();
            if (!value) return std::unexpected(value.error());

            auto number = parse_number<int>(trim_sv(*value));
            if (!number) {
                return std::unexpected(
                    std::format("Option '{}' expects an integer (Mbit/s), got '{}'", name, *value));
            }
            dest = *number;
            return {};
        };

        auto flag = [&](bool& dest) -> std::expected<void, std::string> {
            if (inline_value) {
                return std::unexpected(std::format("Option '{}' does not take a value", name));
            }
            dest = true;
            return {};
        };

        std::expected<void, std::string> status;

        if (name == "-h" || name == "--help") {
            status = flag(opts.show_help);
        } else if (name == "-V" || name == "--version") {
            status = flag(opts.show_version);
        } else if (name == "-v" || name == "--verbose") {
            status = flag(opts.verbose);
        } else if (name == "-w" || name == "--warning") {
            status = take_int(opts.download_warning);
        } else if (name == "-c" || name == "--critical") {
            status = take_int(opts.download_critical);
        } else if (name == "-W" || name == "--Warning") {
            status = take_int(opts.upload_warning);
        } else if (name == "-C" || name == "--Critical") {
            status = take_int(opts.upload_critical);
        } else if (name == "--log-file") {
            auto value = take_value();
            if (value && value->empty()) {
                value = std::unexpected(std::string("Option '--log-file' requires a path"));
            }
            if (value) opts.log_file = std::string(*value);
            else status = std::unexpected(value.error());
        } else if (name == "-t" || name == "--timeout") {
            auto value = take_value();
            if (!value) {
                status = std::unexpected(value.error());
            } else {
                auto seconds = parse_number<long>(trim_sv(*value));
                if (!seconds || *seconds <= 0 || *seconds > Config::MAX_TIMEOUT_SEC) {
                    status = std::unexpected(std::format(
                        "Option '{}' expects 1 to {} seconds, got '{}'", name, Config::MAX_TIMEOUT_SEC, *value));
                } else {
                    opts.timeout_sec = *seconds;
                }
            }
        } else if (name == "--tool") {
            auto value = take_value();
            if (!value) {
                status = std::unexpected(value.error());
            } else if (*value != "speedtest-cli" && *value != "ookla") {
                status = std::unexpected(
                    std::format("Unknown tool '{}' (expected 'speedtest-cli' or 'ookla')", *value));
            } else {
                opts.tool = std::string(*value);
            }
        } else if (name == "-s" || name == "--server") {
            auto value = take_value();
            if (value) opts.server_id = std::string(trim_sv(*value));
            else status = std::unexpected(value.error());
        } else {
            status = std::unexpected(std::format("Unknown option '{}'", arg));
        }

        if (!status) {
            return std::unexpected(status.error());
        }
    }

    return opts;
}
