/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/evaluator.hpp"

#include <format>
#include <string>

namespace {

std::string threshold_field(int value) {
    return value > 0 ? std::to_string(value) : std::string{};
}

bool breached(double speed, int threshold) {
    return threshold > 0 && speed <= static_cast<double>(threshold);
}

}

namespace Evaluator {

std::string_view severity_label(Severity severity) noexcept {
    switch (severity) {
        case Severity::Ok: return "OK";
        case Severity::Warning: return "WARNING";
        case Severity::Critical: return "CRITICAL";
        case Severity::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

int exit_code(Severity severity) noexcept {
    return static_cast<int>(severity);
}

Report evaluate(const std::optional<Measurement>& measurement, const ThresholdSet& thresholds) {
    if (!measurement) {
        return Report{Severity::Unknown, "UNKNOWN: Download=? Upload=?", {}};
    }

    const double download = measurement->download_mbps;
    const double upload = measurement->upload_mbps;

    Severity severity = Severity::Ok;

    if (breached(download, thresholds.download_critical)) {
        severity = Severity::Critical;
    } else if (breached(download, thresholds.download_warning)) {
        severity = Severity::Warning;
    }

    if (breached(upload, thresholds.upload_critical)) {
        severity = Severity::Critical;
    }
    if (breached(upload, thresholds.upload_warning) && severity != Severity::Critical) {
        severity = Severity::Warning;
    }

    Report report;
    report.severity = severity;
    report.summary = std::format(
        "{}: Download={:.2f} Upload={:.2f}", severity_label(severity), download, upload);
    report.perfdata = std::format("Download={:.0f};{};{};; Upload={:.0f};{};{};;",
                                  download,
                                  threshold_field(thresholds.download_warning),
                                  threshold_field(thresholds.download_critical),
                                  upload,
                                  threshold_field(thresholds.upload_warning),
                                  threshold_field(thresholds.upload_critical));
    return report;
}

Severity failure_severity(MeasurementFailure failure) noexcept {
    switch (failure) {
        case MeasurementFailure::Timeout:
        case MeasurementFailure::Interrupted:
            return Severity::Unknown;
        case MeasurementFailure::MissingExecutable:
        case MeasurementFailure::MalformedOutput:
        case MeasurementFailure::ExecutionFailed:
            return Severity::Critical;
    }
    return Severity::Unknown;
}

Report failure_report(const MeasurementError& error, std::string_view tool, long timeout_sec) {
    Severity severity = failure_severity(error.kind);
    std::string reason;

    switch (error.kind) {
        case MeasurementFailure::Timeout:
            reason = std::format("Speed test timed out after {}s", timeout_sec);
            break;
        case MeasurementFailure::Interrupted:
            reason = "Speed test interrupted";
            break;
        case MeasurementFailure::MissingExecutable:
            reason = std::format("Missing program \"{}\"", tool);
            break;
        case MeasurementFailure::MalformedOutput:
            reason = std::format("Malformed output from \"{}\"", tool);
            break;
        case MeasurementFailure::ExecutionFailed:
            reason = "Speed test failed";
            break;
    }

    return Report{severity, std::format("{}: {}", severity_label(severity), reason), {}};
}

}  // namespace Evaluator
