/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <optional>
#include <string_view>

#include "results.hpp"

namespace Evaluator {

[[nodiscard]] std::string_view severity_label(Severity severity) noexcept;
[[nodiscard]] int exit_code(Severity severity) noexcept;

/*
 * Classifies a measurement against the thresholds and renders the plugin
 * status line. An empty measurement means no test was run and yields the
 * fixed UNKNOWN report with no performance data.
 *
 * Download is classified first, then upload may raise the result: upload
 * critical always applies, upload warning only while the result is not
 * CRITICAL. A CRITICAL set by download is never lowered.
 */
[[nodiscard]] Report evaluate(const std::optional<Measurement>& measurement,
                              const ThresholdSet& thresholds);

[[nodiscard]] Severity failure_severity(MeasurementFailure failure) noexcept;

// Stable status line for a failed measurement. Never carries error detail.
[[nodiscard]] Report failure_report(const MeasurementError& error,
                                    std::string_view tool,
                                    long timeout_sec);

}  // namespace Evaluator
