#pragma once

/// @file summary_frame.h
/// @brief Pivot summaries into wide data frames for table binding

#include <string>
#include <string_view>
#include <vector>

#include "common/data_frame.h"
#include "stats/aggregator.h"
#include "stats/stat_engine.h"

namespace clintab::stats {

/// Frame columns describing each summary row
inline constexpr std::string_view kVariableColumn = "variable";
inline constexpr std::string_view kCategoryColumn = "category";
inline constexpr std::string_view kLabelColumn = "label";
inline constexpr std::string_view kKindColumn = "kind";

/// Frame columns describing each response row
inline constexpr std::string_view kSubgroupVariableColumn = "subgroup_variable";
inline constexpr std::string_view kSubgroupColumn = "subgroup";
inline constexpr std::string_view kOddsRatioColumn = "or";
inline constexpr std::string_view kOddsRatioLowerColumn = "or_lower";
inline constexpr std::string_view kOddsRatioUpperColumn = "or_upper";

/// @brief Data column id for a statistic of a group, e.g. "mean_Placebo"
std::string StatColumnId(std::string_view statistic, std::string_view group);

/// @brief One frame row per summary row, one column per statistic and group
///
/// Statistic columns (n, pct, mean, sd, median, min, max) appear only when
/// some row populates them, ordered group by group.
DataFrame SummaryFrame(const std::vector<SummaryRow>& rows,
                       const std::vector<std::string>& groups);

/// @brief One frame row per response row
///
/// Per group: events, total, pct, lower, upper; then or, or_lower, or_upper.
DataFrame ResponseFrame(const std::vector<ResponseSummary>& rows,
                        const std::vector<std::string>& groups);

}  // namespace clintab::stats
