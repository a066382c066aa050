/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <algorithm>
#include <string>

// Declaration order is the order of operational concern; also the exit code.
enum class Severity { Ok = 0, Warning = 1, Critical = 2, Unknown = 3 };

struct Measurement {
    double download_mbps = 0.0;
    double upload_mbps = 0.0;
};

/*
 * Lower bounds in Mbit/s. Zero disables a threshold. Build through
 * from_limits() so that critical is never above warning.
 */
struct ThresholdSet {
    int download_warning = 0;
    int download_critical = 0;
    int upload_warning = 0;
    int upload_critical = 0;

    static ThresholdSet from_limits(int download_warning,
                                    int download_critical,
                                    int upload_warning,
                                    int upload_critical) {
        ThresholdSet t;
        t.download_critical = std::max(download_critical, 0);
        t.download_warning = std::max({download_warning, t.download_critical, 0});
        t.upload_critical = std::max(upload_critical, 0);
        t.upload_warning = std::max({upload_warning, t.upload_critical, 0});
        return t;
    }
};

struct Report {
    Severity severity = Severity::Unknown;
    std::string summary;
    std::string perfdata;

    [[nodiscard]] std::string text() const {
        if (perfdata.empty()) return summary;
        return summary + "|" + perfdata;
    }
};

enum class MeasurementFailure { Timeout, MissingExecutable, MalformedOutput, ExecutionFailed, Interrupted };

struct MeasurementError {
    MeasurementFailure kind = MeasurementFailure::ExecutionFailed;
    std::string detail;
};
