/// @file report_options.cpp
/// @brief Report options from configuration

#include "report/report_options.h"

#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace clintab::report {

namespace {

constexpr int kMaxDecimals = 10;

absl::StatusOr<int> ReadDecimals(const Config& config, std::string_view key,
                                 int default_value) {
    const int64_t decimals = config.GetInt(key, default_value);
    if (decimals < 0 || decimals > kMaxDecimals) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(absl::string_view(key.data(), key.size()), " must be between 0 and ", kMaxDecimals,
                                      ", got ", decimals));
    }
    return static_cast<int>(decimals);
}

}  // namespace

absl::StatusOr<ReportOptions> LoadReportOptions(const Config& config) {
    ReportOptions options;

    options.missing_text = config.GetString("table.missing_text", options.missing_text);
    options.thousands_separator =
        config.GetBool("table.thousands_separator", options.thousands_separator);

    if (config.HasKey("table.footnote_marks")) {
        auto style = table::ParseMarkStyle(config.GetString("table.footnote_marks"));
        if (!style.ok()) {
            return style.status();
        }
        options.mark_style = *style;
    }

    options.confidence_level =
        config.GetDouble("stats.confidence_level", options.confidence_level);
    if (!(options.confidence_level > 0.0 && options.confidence_level < 1.0)) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("stats.confidence_level must be in (0, 1), got ",
                                      options.confidence_level));
    }

    CLINTAB_ASSIGN_OR_RETURN(options.pct_decimals,
                             ReadDecimals(config, "format.pct_decimals", options.pct_decimals));
    CLINTAB_ASSIGN_OR_RETURN(options.mean_decimals,
                             ReadDecimals(config, "format.mean_decimals", options.mean_decimals));
    CLINTAB_ASSIGN_OR_RETURN(options.sd_decimals,
                             ReadDecimals(config, "format.sd_decimals", options.sd_decimals));
    CLINTAB_ASSIGN_OR_RETURN(options.ratio_decimals,
                             ReadDecimals(config, "format.ratio_decimals",
                                          options.ratio_decimals));

    CLINTAB_LOG_DEBUG("Report options: missing \"{}\", marks {}, confidence {}",
                      options.missing_text, table::MarkStyleToString(options.mark_style),
                      options.confidence_level);
    return options;
}

std::string ConfidenceLabel(double confidence_level) {
    const double percent = confidence_level * 100.0;
    if (std::abs(percent - std::round(percent)) < 1e-9) {
        return absl::StrCat(std::llround(percent), "% CI");
    }
    return absl::StrCat(percent, "% CI");
}

}  // namespace clintab::report
