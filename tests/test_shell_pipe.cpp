/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <catch2/catch.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <signal.h>

#include "include/config.hpp"
#include "include/interrupts.hpp"
#include "include/shell_pipe.hpp"

using namespace std::chrono_literals;

TEST_CASE("ShellPipe captures stdout and stderr separately") {
    ShellPipe pipe({"/bin/sh", "-c", "echo out-line; echo err-line >&2"});
    ProcessResult result = pipe.wait(5s);

    REQUIRE(result.succeeded());
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.out == "out-line\n");
    REQUIRE(result.err == "err-line\n");
    REQUIRE_FALSE(result.truncated);
    REQUIRE(pipe.pid() == -1);
}

TEST_CASE("ShellPipe reports the exit status") {
    ShellPipe pipe({"/bin/sh", "-c", "exit 7"});
    ProcessResult result = pipe.wait(5s);

    REQUIRE_FALSE(result.succeeded());
    REQUIRE(result.exit_code == 7);
    REQUIRE(result.term_signal == 0);
}

TEST_CASE("ShellPipe reports a terminating signal") {
    ShellPipe pipe({"/bin/sh", "-c", "kill -KILL $$"});
    ProcessResult result = pipe.wait(5s);

    REQUIRE_FALSE(result.succeeded());
    REQUIRE(result.term_signal == SIGKILL);
}

TEST_CASE("ShellPipe throws ENOENT for a missing executable") {
    try {
        ShellPipe pipe({"/nonexistent/bin/speedtest-cli", "--csv"});
        FAIL("expected std::system_error");
    } catch (const std::system_error& e) {
        REQUIRE(e.code() == std::errc::no_such_file_or_directory);
    }
}

TEST_CASE("ShellPipe rejects an empty argument list") {
    REQUIRE_THROWS_AS(ShellPipe(std::vector<std::string>{}), std::invalid_argument);
}

TEST_CASE("ShellPipe times out and kills the child") {
    auto start = std::chrono::steady_clock::now();
    pid_t child = -1;
    {
        ShellPipe pipe({"/bin/sh", "-c", "sleep 10"});
        child = pipe.pid();
        REQUIRE(child > 0);
        REQUIRE_THROWS_AS(pipe.wait(150ms), ProcessTimeout);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed < 5s);
    // Reaped: the pid no longer names a child of ours.
    int rc = ::kill(child, 0);
    int err = errno;
    REQUIRE(rc == -1);
    REQUIRE(err == ESRCH);
}

TEST_CASE("ShellPipe stops waiting when interrupted") {
    // Cleared even when the assertion fails, so later tests are unaffected.
    struct InterruptFlag {
        InterruptFlag() { g_interrupted = true; }
        ~InterruptFlag() { g_interrupted = false; }
    };

    ShellPipe pipe({"/bin/sh", "-c", "sleep 10"});
    InterruptFlag flag;
    REQUIRE_THROWS_AS(pipe.wait(5s), ProcessInterrupted);
}

TEST_CASE("ShellPipe accepts an unbounded timeout") {
    ShellPipe pipe({"/bin/sh", "-c", "echo done"});
    ProcessResult result = pipe.wait(std::chrono::milliseconds::max());

    REQUIRE(result.succeeded());
    REQUIRE(result.out == "done\n");
}

TEST_CASE("ShellPipe caps captured output") {
    ShellPipe pipe({"/bin/sh", "-c", "head -c 11000000 /dev/zero"});
    ProcessResult result = pipe.wait(30s);

    REQUIRE(result.succeeded());
    REQUIRE(result.truncated);
    REQUIRE(result.out.size() <= Config::MAX_OUTPUT_SIZE);
}
