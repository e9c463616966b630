#pragma once

/// @file standard_tables.h
/// @brief Standard clinical summary tables built on the table model

#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "report/report_options.h"
#include "stats/aggregator.h"
#include "stats/stat_engine.h"
#include "table/table_model.h"

namespace clintab::report {

/// @brief Demographic / baseline characteristics table
///
/// One column per group labeled "<group> (N=<total>)". Categorical rows show
/// "n (pct%)"; continuous variables show n, "mean (sd)", median and
/// "min - max". Each variable is a row group with its rows indented.
/// Group totals come from the first categorical variable; without one, the
/// largest count row of the group is used.
absl::StatusOr<table::TableModel> BuildDemographicTable(
    const std::vector<stats::SummaryRow>& rows,
    const std::vector<std::string>& groups,
    const ReportOptions& options);

/// @brief Event rate table with exact intervals and an odds ratio
///
/// Per group "events/total (pct%)" and "[lower, upper]" under a spanner
/// naming the group, then "or (lower, upper)" of treatment versus
/// reference. Subgroup rows are grouped by subgroup variable after the
/// overall row. Footnotes name the interval methods.
///
/// Interval labels use the confidence level stored in the rows;
/// options.confidence_level applies only when there are no rows. Rows
/// computed at different levels are rejected.
absl::StatusOr<table::TableModel> BuildResponseTable(
    const std::vector<stats::ResponseSummary>& rows,
    const std::vector<std::string>& groups,
    std::string_view treatment,
    std::string_view reference,
    const ReportOptions& options);

}  // namespace clintab::report
