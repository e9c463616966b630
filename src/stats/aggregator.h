#pragma once

/// @file aggregator.h
/// @brief Orchestrates the stat engine over variables and subgroups

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "common/value.h"
#include "stats/records.h"
#include "stats/stat_engine.h"

namespace clintab::stats {

/// @brief Summarize variables per group into one long summary
///
/// Each variable is dispatched on its type descriptor: categorical variables
/// yield one row per level, continuous variables the four fixed rows. Every
/// row is tagged with VariableSpec::CategoryLabel(). Rows are concatenated in
/// variable declaration order.
///
/// Fails with ErrorCode::kUnknownVariableType when a variable carries no
/// type metadata.
///
/// @param groups Group order; empty means first-appearance order
absl::StatusOr<std::vector<SummaryRow>> Aggregate(
    const std::vector<SubjectRecord>& records,
    std::string_view group_var,
    const std::vector<VariableSpec>& variables,
    const std::vector<std::string>& groups = {});

/// @brief Configuration of an event-rate summary
struct ResponseOptions {
    std::string group_var;
    std::string response_var;

    /// Response value counted as an event
    Value event_value = std::string("Y");

    /// Optional stratifying variable; empty means overall only
    std::string subgroup_var;

    /// Odds ratio is odds(treatment) / odds(reference)
    std::string treatment_group;
    std::string reference_group;

    /// Group order; empty means first-appearance order
    std::vector<std::string> groups;

    double confidence = 0.95;
    std::string overall_label = "All subjects";
};

/// @brief Event counts of one group within a subgroup
struct GroupResponse {
    std::string group;
    int64_t events = 0;
    int64_t total = 0;
    std::optional<double> pct;  ///< Fraction in [0, 1]
    ProportionInterval interval;
};

/// @brief One row of an event-rate table
struct ResponseSummary {
    std::string subgroup_variable;  ///< Empty for the overall row
    std::string subgroup;
    std::vector<GroupResponse> groups;
    OddsRatioEstimate odds_ratio;

    /// Confidence level the intervals were computed at
    double confidence = 0.95;

    const GroupResponse* ForGroup(std::string_view group) const;
};

/// @brief Event rates, exact intervals and odds ratios per subgroup
///
/// The first row covers all records; with a subgroup variable, one row per
/// subgroup value follows in first-appearance order. Records with a missing
/// response are left out of the totals.
absl::StatusOr<std::vector<ResponseSummary>> SummarizeResponse(
    const std::vector<SubjectRecord>& records,
    const ResponseOptions& options);

}  // namespace clintab::stats
