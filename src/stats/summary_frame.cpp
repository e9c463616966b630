/// @file summary_frame.cpp
/// @brief Summary and response pivots

#include "stats/summary_frame.h"

#include <array>
#include <functional>
#include <optional>

#include <absl/strings/str_cat.h>

namespace clintab::stats {

namespace {

using StatGetter = std::function<std::optional<double>(const GroupStatistics&)>;

const std::array<std::pair<std::string_view, StatGetter>, 7>& StatisticFields() {
    static const std::array<std::pair<std::string_view, StatGetter>, 7> kFields = {{
        {"n", [](const GroupStatistics& s) -> std::optional<double> {
            if (s.n.has_value()) return static_cast<double>(*s.n);
            return std::nullopt;
        }},
        {"pct", [](const GroupStatistics& s) { return s.pct; }},
        {"mean", [](const GroupStatistics& s) { return s.mean; }},
        {"sd", [](const GroupStatistics& s) { return s.sd; }},
        {"median", [](const GroupStatistics& s) { return s.median; }},
        {"min", [](const GroupStatistics& s) { return s.min; }},
        {"max", [](const GroupStatistics& s) { return s.max; }},
    }};
    return kFields;
}

/// A statistic is "seen" once any row displays it, even when its value is
/// undefined for the data (e.g. the SD of one observation)
bool StatisticSeen(const std::vector<SummaryRow>& rows, std::string_view statistic) {
    for (const auto& row : rows) {
        switch (row.kind) {
            case SummaryRowKind::kCategory:
                if (statistic == "n" || statistic == "pct") return true;
                break;
            case SummaryRowKind::kCount:
                if (statistic == "n") return true;
                break;
            case SummaryRowKind::kMeanSd:
                if (statistic == "mean" || statistic == "sd") return true;
                break;
            case SummaryRowKind::kMedian:
                if (statistic == "median") return true;
                break;
            case SummaryRowKind::kRange:
                if (statistic == "min" || statistic == "max") return true;
                break;
        }
    }
    return false;
}

}  // namespace

std::string StatColumnId(std::string_view statistic, std::string_view group) {
    return absl::StrCat(absl::string_view(statistic.data(), statistic.size()), "_", absl::string_view(group.data(), group.size()));
}

DataFrame SummaryFrame(const std::vector<SummaryRow>& rows,
                       const std::vector<std::string>& groups) {
    DataFrame frame({std::string(kVariableColumn), std::string(kCategoryColumn),
                     std::string(kLabelColumn), std::string(kKindColumn)});

    const auto& fields = StatisticFields();
    for (const auto& group : groups) {
        for (const auto& [statistic, getter] : fields) {
            if (StatisticSeen(rows, statistic)) {
                frame.AddColumn(StatColumnId(statistic, group));
            }
        }
    }

    for (const auto& row : rows) {
        const size_t index = frame.AddRow();
        frame.Set(index, kVariableColumn, row.variable);
        frame.Set(index, kCategoryColumn, row.category);
        frame.Set(index, kLabelColumn, row.label);
        frame.Set(index, kKindColumn, std::string(SummaryRowKindToString(row.kind)));

        for (const auto& stats : row.groups) {
            for (const auto& [statistic, getter] : fields) {
                const std::string column = StatColumnId(statistic, stats.group);
                if (frame.ColumnIndex(column).has_value()) {
                    frame.Set(index, column, ToValue(getter(stats)));
                }
            }
        }
    }
    return frame;
}

DataFrame ResponseFrame(const std::vector<ResponseSummary>& rows,
                        const std::vector<std::string>& groups) {
    DataFrame frame({std::string(kSubgroupVariableColumn), std::string(kSubgroupColumn)});
    for (const auto& group : groups) {
        for (std::string_view statistic : {"events", "total", "pct", "lower", "upper"}) {
            frame.AddColumn(StatColumnId(statistic, group));
        }
    }
    frame.AddColumn(std::string(kOddsRatioColumn));
    frame.AddColumn(std::string(kOddsRatioLowerColumn));
    frame.AddColumn(std::string(kOddsRatioUpperColumn));

    for (const auto& row : rows) {
        const size_t index = frame.AddRow();
        frame.Set(index, kSubgroupVariableColumn, row.subgroup_variable);
        frame.Set(index, kSubgroupColumn, row.subgroup);

        for (const auto& group : groups) {
            const GroupResponse* response = row.ForGroup(group);
            if (response == nullptr) {
                continue;
            }
            frame.Set(index, StatColumnId("events", group), static_cast<double>(response->events));
            frame.Set(index, StatColumnId("total", group), static_cast<double>(response->total));
            frame.Set(index, StatColumnId("pct", group), ToValue(response->pct));
            frame.Set(index, StatColumnId("lower", group), ToValue(response->interval.lower));
            frame.Set(index, StatColumnId("upper", group), ToValue(response->interval.upper));
        }

        frame.Set(index, kOddsRatioColumn, ToValue(row.odds_ratio.odds_ratio));
        frame.Set(index, kOddsRatioLowerColumn, ToValue(row.odds_ratio.lower));
        frame.Set(index, kOddsRatioUpperColumn, ToValue(row.odds_ratio.upper));
    }
    return frame;
}

}  // namespace clintab::stats
