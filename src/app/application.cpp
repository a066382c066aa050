/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <string>

#include "include/config.hpp"
#include "include/evaluator.hpp"
#include "include/interrupts.hpp"
#include "include/logger.hpp"
#include "include/options.hpp"
#include "include/results.hpp"
#include "include/speed_test.hpp"

namespace fs = std::filesystem;

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options]", app_name);
    std::println("");
    std::println("Nagios check for internet connection speed.");
    std::println("");
    std::println("Options:");
    std::println("  -w, --warning N         Lower download speed warning limit (Mbit/s), default: 0 (no warning)");
    std::println("  -c, --critical N        Lower download speed critical limit (Mbit/s), default: 0 (no critical)");
    std::println("  -W, --Warning N         Lower upload speed warning limit (Mbit/s), default: 0 (no warning)");
    std::println("  -C, --Critical N        Lower upload speed critical limit (Mbit/s), default: 0 (no critical)");
    std::println("  -t, --timeout SEC       Speed test timeout, default: {}", Config::SPEEDTEST_TIMEOUT_SEC);
    std::println("      --tool NAME         speedtest-cli (default) or ookla");
    std::println("  -s, --server ID         Test against a specific server");
    std::println("  -v, --verbose           Enable verbose output");
    std::println("      --log-file PATH     File to log to, default: <stderr>");
    std::println("  -h, --help              Show this help message");
    std::println("  -V, --version           Show version information");
    std::println("");
    std::println("Examples:");
    std::println("  {} -w 50 -c 20 -W 10 -C 5", app_name);
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

int Application::run(int argc, char* argv[]) {
    SignalGuard signal_guard;

    std::string app_name{Config::APP_NAME};
    if (argc > 0) {
        app_name = fs::path(argv[0]).filename().string();
        if (app_name.empty())
            app_name = Config::APP_NAME;
    }

    auto parsed = parse_options(argc, argv);
    if (!parsed) {
        std::println("UNKNOWN: {}", parsed.error());
        std::println(stderr, "Try '{} --help' for more information.", app_name);
        return Evaluator::exit_code(Severity::Unknown);
    }

    const CheckOptions& opts = *parsed;

    if (opts.show_help) {
        show_help(app_name);
        return Evaluator::exit_code(Severity::Unknown);
    }
    if (opts.show_version) {
        show_version();
        return Evaluator::exit_code(Severity::Unknown);
    }

    Logger log(opts.verbose ? LogLevel::Debug : LogLevel::Info, opts.log_file);

    try {
        const ThresholdSet thresholds = opts.thresholds();
        log.debug("Thresholds: download warning={} critical={}; upload warning={} critical={}",
                  thresholds.download_warning,
                  thresholds.download_critical,
                  thresholds.upload_warning,
                  thresholds.upload_critical);

        const ToolProfile profile = opts.tool_profile();
        SpeedTest st(profile, std::chrono::seconds(opts.timeout_sec), log);

        auto measurement = st.run();
        if (!measurement) {
            const MeasurementError& err = measurement.error();
            Report report = Evaluator::failure_report(err, profile.name(), opts.timeout_sec);

            if (report.severity == Severity::Unknown) {
                log.warning("{}", err.detail);
            } else {
                log.critical("{}", err.detail);
            }

            std::println("{}", report.text());
            return Evaluator::exit_code(report.severity);
        }

        Report report = Evaluator::evaluate(*measurement, thresholds);
        log.debug("{}", report.text());
        std::println("{}", report.text());
        return Evaluator::exit_code(report.severity);

    } catch (const std::exception& e) {
        log.critical("Fatal Error: {}", e.what());
        std::println("UNKNOWN: Internal error");
        return Evaluator::exit_code(Severity::Unknown);
    }
}
