#pragma once

/// @file stat_engine.h
/// @brief Per-group descriptive statistics and interval estimators
///
/// Everything here is a pure function of its arguments: no shared state,
/// safe to call independently per variable or subgroup.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "stats/records.h"

namespace clintab::stats {

/// @brief What a summary row displays
enum class SummaryRowKind {
    kCategory,  ///< One level of a categorical variable: n, pct
    kCount,     ///< Continuous "n"
    kMeanSd,    ///< Continuous "Mean (SD)"
    kMedian,    ///< Continuous "Median"
    kRange      ///< Continuous "Min - Max"
};

std::string_view SummaryRowKindToString(SummaryRowKind kind);

/// @brief Statistics of one group within a summary row
///
/// Only the fields the row displays are set; std::nullopt means "not
/// applicable" (including statistics that are undefined for the data, such
/// as the SD of a single observation).
struct GroupStatistics {
    std::string group;
    std::optional<int64_t> n;
    std::optional<double> pct;  ///< Fraction in [0, 1]
    std::optional<double> mean;
    std::optional<double> sd;
    std::optional<double> median;
    std::optional<double> min;
    std::optional<double> max;
};

/// @brief One (variable, category-or-statistic) row
struct SummaryRow {
    std::string variable;
    std::string label;     ///< Category level or statistic label
    std::string category;  ///< Tag grouping the rows of one variable
    SummaryRowKind kind = SummaryRowKind::kCategory;
    std::vector<GroupStatistics> groups;

    /// @brief Statistics of a group, nullptr if the group is not present
    const GroupStatistics* ForGroup(std::string_view group) const;
};

/// Fixed labels of the four continuous rows
inline constexpr std::string_view kCountLabel = "n";
inline constexpr std::string_view kMeanSdLabel = "Mean (SD)";
inline constexpr std::string_view kMedianLabel = "Median";
inline constexpr std::string_view kRangeLabel = "Min - Max";

/// Category used for missing values of a categorical variable
inline constexpr std::string_view kMissingCategory = "Missing";

/// @brief Count and percentage of each level of a categorical variable
///
/// Percentages use the group's total record count as denominator, so the
/// counts of the returned rows add up to that total for every group.
/// Missing values form their own trailing "Missing" row when present.
/// Unobserved (level, group) pairs are explicit zeros.
///
/// @param groups Group order; empty means first-appearance order
absl::StatusOr<std::vector<SummaryRow>> SummarizeCategorical(
    const std::vector<SubjectRecord>& records,
    std::string_view group_var,
    std::string_view variable,
    const CategoricalType& type,
    const std::vector<std::string>& groups = {});

/// @brief n / Mean (SD) / Median / Min - Max of a continuous variable
///
/// Missing and non-numeric values are ignored in every statistic. Always
/// returns exactly four rows.
absl::StatusOr<std::vector<SummaryRow>> SummarizeContinuous(
    const std::vector<SubjectRecord>& records,
    std::string_view group_var,
    std::string_view variable,
    const std::vector<std::string>& groups = {});

/// @brief Two-sided confidence bounds of a proportion, as fractions
struct ProportionInterval {
    std::optional<double> lower;
    std::optional<double> upper;
};

/// @brief Exact (Clopper-Pearson) binomial interval from beta quantiles
///
/// lower = 0 when successes == 0, upper = 1 when successes == total, both
/// undefined when total == 0.
absl::StatusOr<ProportionInterval> ClopperPearson(int64_t successes,
                                                  int64_t total,
                                                  double confidence = 0.95);

/// @brief Odds ratio of group a against group b with its Wald interval
struct OddsRatioEstimate {
    std::optional<double> odds_ratio;
    std::optional<double> lower;
    std::optional<double> upper;
};

/// @brief odds(a) / odds(b) with a log-scale Wald interval
///
/// The variance of log(OR) is 1/a + 1/b + 1/c + 1/d over the four cells
/// (responders and non-responders of each group). The ratio and its
/// interval are both undefined when any of the four cells is zero.
absl::StatusOr<OddsRatioEstimate> OddsRatioCI(int64_t responders_a,
                                              int64_t total_a,
                                              int64_t responders_b,
                                              int64_t total_b,
                                              double confidence = 0.95);

}  // namespace clintab::stats
