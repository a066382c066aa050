/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>

#include "config.hpp"
#include "results.hpp"
#include "speed_test.hpp"

struct CheckOptions {
    int download_warning = 0;
    int download_critical = 0;
    int upload_warning = 0;
    int upload_critical = 0;

    bool verbose = false;
    std::string log_file;

    long timeout_sec = Config::SPEEDTEST_TIMEOUT_SEC;
    std::string tool{Config::SPEEDTEST_CLI};
    std::string server_id;

    bool show_help = false;
    bool show_version = false;

    [[nodiscard]] ThresholdSet thresholds() const {
        return ThresholdSet::from_limits(download_warning, download_critical, upload_warning, upload_critical);
    }

    [[nodiscard]] ToolProfile tool_profile() const;
};

// Accepts "-w 10", "--warning 10" and "--warning=10". Errors are one-line messages.
std::expected<CheckOptions, std::string> parse_options(int argc, const char* const argv[]);
