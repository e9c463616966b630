#pragma once

/// @file report_options.h
/// @brief Presentation settings shared by the standard table builders

#include <string>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "table/format.h"

namespace clintab::report {

struct ReportOptions {
    std::string missing_text = "NE";
    table::MarkStyle mark_style = table::MarkStyle::kNumeric;
    bool thousands_separator = false;
    double confidence_level = 0.95;

    int pct_decimals = 1;
    int mean_decimals = 1;
    int sd_decimals = 2;
    int ratio_decimals = 2;
};

/// @brief Read report options from configuration
///
/// Keys: table.missing_text, table.footnote_marks, table.thousands_separator,
/// stats.confidence_level, format.pct_decimals, format.mean_decimals,
/// format.sd_decimals, format.ratio_decimals. Absent keys keep their
/// defaults; invalid values fail with ErrorCode::kConfigurationError.
absl::StatusOr<ReportOptions> LoadReportOptions(const Config& config);

/// @brief Interval column label, e.g. "95% CI"
std::string ConfidenceLabel(double confidence_level);

}  // namespace clintab::report
