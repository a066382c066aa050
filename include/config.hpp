/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "check_speedtest";
    constexpr std::string_view APP_VERSION = "1.2.0";

    constexpr std::string_view SPEEDTEST_CLI = "speedtest-cli";
    constexpr std::string_view OOKLA_CLI = "speedtest";

    constexpr long SPEEDTEST_TIMEOUT_SEC = 60;
    constexpr long MAX_TIMEOUT_SEC = 86400;
    constexpr long CHILD_TERM_GRACE_MS = 1000;
    constexpr int CHILD_REAP_ATTEMPTS = 5;
    constexpr int CHILD_REAP_INTERVAL_MS = 100;
    constexpr int CHILD_EXIT_POLL_MS = 10;

    constexpr std::size_t PIPE_READ_CHUNK = 4096;
    constexpr std::size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;

    constexpr double BITS_PER_MEGABIT = 1000000.0;
    constexpr double BITS_PER_BYTE = 8.0;

    constexpr std::size_t CSV_DOWNLOAD_FIELD = 6;
    constexpr std::size_t CSV_UPLOAD_FIELD = 7;
}
