/// @file stat_engine.cpp
/// @brief Descriptive statistics and interval estimator implementations

#include "stats/stat_engine.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <boost/math/distributions/beta.hpp>
#include <boost/math/distributions/normal.hpp>

#include "common/error.h"
#include "common/logging.h"

namespace clintab::stats {

namespace {

absl::Status ValidateConfidence(double confidence) {
    if (!(confidence > 0.0 && confidence < 1.0)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Confidence level must be in (0, 1), got ", confidence));
    }
    return absl::OkStatus();
}

std::vector<std::string> ResolveGroups(const std::vector<SubjectRecord>& records,
                                       std::string_view group_var,
                                       const std::vector<std::string>& groups) {
    return groups.empty() ? GroupLevels(records, group_var) : groups;
}

/// Numeric content of a value; numeric text is accepted as well
std::optional<double> NumericValue(const Value& value) {
    if (auto number = AsNumber(value)) {
        return std::isnan(*number) ? std::nullopt : number;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        double parsed = 0.0;
        if (absl::SimpleAtod(*text, &parsed) && !std::isnan(parsed)) {
            return parsed;
        }
    }
    return std::nullopt;
}

double Median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return 0.5 * (values[mid - 1] + values[mid]);
}

}  // namespace

std::string_view SummaryRowKindToString(SummaryRowKind kind) {
    switch (kind) {
        case SummaryRowKind::kCategory: return "category";
        case SummaryRowKind::kCount: return "count";
        case SummaryRowKind::kMeanSd: return "mean_sd";
        case SummaryRowKind::kMedian: return "median";
        case SummaryRowKind::kRange: return "range";
    }
    return "unknown";
}

const GroupStatistics* SummaryRow::ForGroup(std::string_view group) const {
    for (const auto& stats : groups) {
        if (stats.group == group) {
            return &stats;
        }
    }
    return nullptr;
}

// =============================================================================
// Descriptive summaries
// =============================================================================

absl::StatusOr<std::vector<SummaryRow>> SummarizeCategorical(
    const std::vector<SubjectRecord>& records,
    std::string_view group_var,
    std::string_view variable,
    const CategoricalType& type,
    const std::vector<std::string>& groups) {

    if (group_var.empty() || variable.empty()) {
        return absl::InvalidArgumentError("Group and variable names must be non-empty");
    }

    const std::vector<std::string> group_order = ResolveGroups(records, group_var, groups);

    std::vector<std::string> levels = type.levels;
    std::unordered_map<std::string, std::unordered_map<std::string, int64_t>> counts;
    std::unordered_map<std::string, int64_t> group_totals;
    std::unordered_map<std::string, int64_t> missing_counts;

    for (const auto& record : records) {
        auto group = CategoryKey(record.Get(group_var));
        if (!group.has_value()) {
            continue;
        }
        ++group_totals[*group];

        auto level = CategoryKey(record.Get(variable));
        if (!level.has_value()) {
            ++missing_counts[*group];
            continue;
        }
        if (std::find(levels.begin(), levels.end(), *level) == levels.end()) {
            levels.push_back(*level);
        }
        ++counts[*level][*group];
    }

    auto make_row = [&](const std::string& label, auto count_of) {
        SummaryRow row;
        row.variable = std::string(variable);
        row.label = label;
        row.kind = SummaryRowKind::kCategory;
        for (const auto& group : group_order) {
            GroupStatistics stats;
            stats.group = group;
            stats.n = count_of(group);
            auto total = group_totals.find(group);
            if (total != group_totals.end() && total->second > 0) {
                stats.pct = static_cast<double>(*stats.n) / static_cast<double>(total->second);
            }
            row.groups.push_back(std::move(stats));
        }
        return row;
    };

    std::vector<SummaryRow> rows;
    rows.reserve(levels.size() + 1);
    for (const auto& level : levels) {
        const auto& level_counts = counts[level];
        rows.push_back(make_row(level, [&level_counts](const std::string& group) -> int64_t {
            auto it = level_counts.find(group);
            return it == level_counts.end() ? 0 : it->second;
        }));
    }

    if (!missing_counts.empty()) {
        rows.push_back(make_row(std::string(kMissingCategory),
                                [&missing_counts](const std::string& group) -> int64_t {
            auto it = missing_counts.find(group);
            return it == missing_counts.end() ? 0 : it->second;
        }));
    }

    CLINTAB_LOG_DEBUG("Categorical summary of {}: {} levels over {} groups",
                      variable, rows.size(), group_order.size());
    return rows;
}

absl::StatusOr<std::vector<SummaryRow>> SummarizeContinuous(
    const std::vector<SubjectRecord>& records,
    std::string_view group_var,
    std::string_view variable,
    const std::vector<std::string>& groups) {

    if (group_var.empty() || variable.empty()) {
        return absl::InvalidArgumentError("Group and variable names must be non-empty");
    }

    const std::vector<std::string> group_order = ResolveGroups(records, group_var, groups);

    std::unordered_map<std::string, std::vector<double>> observations;
    size_t ignored = 0;
    for (const auto& record : records) {
        auto group = CategoryKey(record.Get(group_var));
        if (!group.has_value()) {
            continue;
        }
        const Value& value = record.Get(variable);
        if (auto number = NumericValue(value)) {
            observations[*group].push_back(*number);
        } else if (!IsMissing(value)) {
            ++ignored;
        }
    }
    if (ignored > 0) {
        CLINTAB_LOG_WARN("Ignored {} non-numeric values of continuous variable {}",
                         ignored, variable);
    }

    const std::pair<SummaryRowKind, std::string_view> layout[] = {
        {SummaryRowKind::kCount, kCountLabel},
        {SummaryRowKind::kMeanSd, kMeanSdLabel},
        {SummaryRowKind::kMedian, kMedianLabel},
        {SummaryRowKind::kRange, kRangeLabel},
    };

    std::vector<SummaryRow> rows;
    rows.reserve(4);
    for (const auto& [kind, label] : layout) {
        SummaryRow row;
        row.variable = std::string(variable);
        row.label = std::string(label);
        row.kind = kind;
        rows.push_back(std::move(row));
    }

    for (const auto& group : group_order) {
        const auto it = observations.find(group);
        const std::vector<double> empty;
        const std::vector<double>& values = it == observations.end() ? empty : it->second;
        const auto n = static_cast<int64_t>(values.size());

        GroupStatistics count{.group = group};
        GroupStatistics mean_sd{.group = group};
        GroupStatistics median{.group = group};
        GroupStatistics range{.group = group};
        count.n = n;

        if (n > 0) {
            const double sum = std::accumulate(values.begin(), values.end(), 0.0);
            const double mean = sum / static_cast<double>(n);
            mean_sd.mean = mean;

            if (n > 1) {
                double sq = 0.0;
                for (double v : values) {
                    sq += (v - mean) * (v - mean);
                }
                mean_sd.sd = std::sqrt(sq / static_cast<double>(n - 1));
            }

            median.median = Median(values);
            auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
            range.min = *min_it;
            range.max = *max_it;
        }

        rows[0].groups.push_back(std::move(count));
        rows[1].groups.push_back(std::move(mean_sd));
        rows[2].groups.push_back(std::move(median));
        rows[3].groups.push_back(std::move(range));
    }

    CLINTAB_LOG_DEBUG("Continuous summary of {} over {} groups", variable, group_order.size());
    return rows;
}

// =============================================================================
// Interval estimators
// =============================================================================

absl::StatusOr<ProportionInterval> ClopperPearson(int64_t successes,
                                                  int64_t total,
                                                  double confidence) {
    CLINTAB_RETURN_IF_ERROR(ValidateConfidence(confidence));
    if (successes < 0 || total < 0 || successes > total) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid binomial counts: ", successes, " of ", total));
    }

    ProportionInterval interval;
    if (total == 0) {
        return interval;
    }

    const double alpha = 1.0 - confidence;
    const double x = static_cast<double>(successes);
    const double n = static_cast<double>(total);

    if (successes == 0) {
        interval.lower = 0.0;
    } else {
        boost::math::beta_distribution<> lower_dist(x, n - x + 1.0);
        interval.lower = boost::math::quantile(lower_dist, alpha / 2.0);
    }

    if (successes == total) {
        interval.upper = 1.0;
    } else {
        boost::math::beta_distribution<> upper_dist(x + 1.0, n - x);
        interval.upper = boost::math::quantile(upper_dist, 1.0 - alpha / 2.0);
    }

    return interval;
}

absl::StatusOr<OddsRatioEstimate> OddsRatioCI(int64_t responders_a,
                                              int64_t total_a,
                                              int64_t responders_b,
                                              int64_t total_b,
                                              double confidence) {
    CLINTAB_RETURN_IF_ERROR(ValidateConfidence(confidence));
    if (responders_a < 0 || responders_b < 0 ||
        responders_a > total_a || responders_b > total_b) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid response counts: ", responders_a, "/", total_a, " vs ",
            responders_b, "/", total_b));
    }

    const double a = static_cast<double>(responders_a);
    const double b = static_cast<double>(total_a - responders_a);
    const double c = static_cast<double>(responders_b);
    const double d = static_cast<double>(total_b - responders_b);

    // Every cell feeds the variance term; a zero cell leaves everything undefined
    OddsRatioEstimate estimate;
    if (a == 0.0 || b == 0.0 || c == 0.0 || d == 0.0) {
        return estimate;
    }

    const double odds_ratio = (a / b) / (c / d);
    estimate.odds_ratio = odds_ratio;

    const double z =
        boost::math::quantile(boost::math::normal(), 1.0 - (1.0 - confidence) / 2.0);
    const double se = std::sqrt(1.0 / a + 1.0 / b + 1.0 / c + 1.0 / d);
    const double log_or = std::log(odds_ratio);
    estimate.lower = std::exp(log_or - z * se);
    estimate.upper = std::exp(log_or + z * se);
    return estimate;
}

}  // namespace clintab::stats
