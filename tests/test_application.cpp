/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <catch2/catch.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "include/application.hpp"

namespace fs = std::filesystem;

namespace {

// Temporary directory that replaces PATH, so "speedtest-cli" resolves to a stub.
class StubPath {
    fs::path dir_;
    std::string old_path_;
    bool had_path_ = false;

   public:
    StubPath() {
        dir_ = fs::temp_directory_path() / ("check_speedtest_path_" + std::to_string(::getpid()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        if (const char* p = std::getenv("PATH")) {
            old_path_ = p;
            had_path_ = true;
        }
        ::setenv("PATH", dir_.c_str(), 1);
    }

    ~StubPath() {
        if (had_path_) {
            ::setenv("PATH", old_path_.c_str(), 1);
        } else {
            ::unsetenv("PATH");
        }
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    StubPath(const StubPath&) = delete;
    StubPath& operator=(const StubPath&) = delete;

    void add_tool(const std::string& name, const std::string& script_body) {
        fs::path tool = dir_ / name;
        {
            std::ofstream out(tool);
            out << "#!/bin/sh\n" << script_body << "\n";
        }
        fs::permissions(tool, fs::perms::owner_all, fs::perm_options::replace);
    }
};

struct RunOutput {
    int exit_code = -1;
    std::string stdout_text;
};

// Runs the plugin with stdout redirected into a temp file.
RunOutput run_plugin(std::initializer_list<std::string> args) {
    std::vector<std::string> storage{"check_speedtest"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::unique_ptr<std::FILE, int (*)(std::FILE*)> capture{std::tmpfile(), std::fclose};
    REQUIRE(capture != nullptr);

    std::fflush(stdout);
    int saved = ::dup(STDOUT_FILENO);
    REQUIRE(saved >= 0);
    ::dup2(::fileno(capture.get()), STDOUT_FILENO);

    RunOutput out;
    Application app;
    out.exit_code = app.run(static_cast<int>(storage.size()), argv.data());

    std::fflush(stdout);
    ::dup2(saved, STDOUT_FILENO);
    ::close(saved);

    std::rewind(capture.get());
    char buf[512];
    std::size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), capture.get())) > 0) {
        out.stdout_text.append(buf, n);
    }
    return out;
}

}

TEST_CASE("plugin prints one report line and exits with its severity") {
    StubPath path;
    path.add_tool("speedtest-cli",
                  "echo '8018,Telekom,Berlin,2025-03-01T10:00:00Z,12.3,15.2,5000000,50000000,,203.0.113.7'");

    RunOutput ok = run_plugin({});
    REQUIRE(ok.exit_code == 0);
    REQUIRE(ok.stdout_text == "OK: Download=5.00 Upload=50.00|Download=5;;;; Upload=50;;;;\n");

    RunOutput warn = run_plugin({"-w", "10"});
    REQUIRE(warn.exit_code == 1);
    REQUIRE(warn.stdout_text == "WARNING: Download=5.00 Upload=50.00|Download=5;10;;; Upload=50;;;;\n");

    RunOutput crit = run_plugin({"--Critical=60"});
    REQUIRE(crit.exit_code == 2);
    REQUIRE(crit.stdout_text == "CRITICAL: Download=5.00 Upload=50.00|Download=5;;;; Upload=50;60;60;;\n");
}

TEST_CASE("plugin reports a missing tool as CRITICAL") {
    StubPath path;

    RunOutput out = run_plugin({});
    REQUIRE(out.exit_code == 2);
    REQUIRE(out.stdout_text == "CRITICAL: Missing program \"speedtest-cli\"\n");
}

TEST_CASE("plugin reports a failing tool without its error text") {
    StubPath path;
    path.add_tool("speedtest-cli", "echo 'Cannot retrieve speedtest configuration' >&2; exit 1");

    RunOutput out = run_plugin({});
    REQUIRE(out.exit_code == 2);
    REQUIRE(out.stdout_text == "CRITICAL: Speed test failed\n");
}

TEST_CASE("plugin reports a timeout as UNKNOWN") {
    StubPath path;
    path.add_tool("speedtest-cli", "exec /bin/sleep 10");

    RunOutput out = run_plugin({"-t", "1"});
    REQUIRE(out.exit_code == 3);
    REQUIRE(out.stdout_text == "UNKNOWN: Speed test timed out after 1s\n");
}

TEST_CASE("plugin reports a usage error as UNKNOWN") {
    RunOutput out = run_plugin({"-w", "fast"});
    REQUIRE(out.exit_code == 3);
    REQUIRE(out.stdout_text == "UNKNOWN: Option '-w' expects an integer (Mbit/s), got 'fast'\n");

    RunOutput unknown = run_plugin({"--frobnicate"});
    REQUIRE(unknown.exit_code == 3);
    REQUIRE(unknown.stdout_text == "UNKNOWN: Unknown option '--frobnicate'\n");
}
