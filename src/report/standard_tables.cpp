/// @file standard_tables.cpp
/// @brief Demographic and response table builders

#include "report/standard_tables.h"

#include <algorithm>
#include <map>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "stats/summary_frame.h"

namespace clintab::report {

using stats::StatColumnId;
using table::ColumnSelector;
using table::FormatRule;
using table::RowFilter;
using table::TableModel;

namespace {

constexpr std::string_view kDemographicStubHeader = "Characteristic";
constexpr std::string_view kResponseStubHeader = "Subgroup";

/// Total subjects per group
std::map<std::string, int64_t> GroupTotals(const std::vector<stats::SummaryRow>& rows,
                                           const std::vector<std::string>& groups) {
    std::map<std::string, int64_t> totals;
    for (const auto& group : groups) {
        totals[group] = 0;
    }

    auto first_categorical = std::find_if(rows.begin(), rows.end(), [](const auto& row) {
        return row.kind == stats::SummaryRowKind::kCategory;
    });

    for (const auto& row : rows) {
        const bool counts = first_categorical != rows.end()
                                ? row.kind == stats::SummaryRowKind::kCategory &&
                                      row.variable == first_categorical->variable
                                : row.kind == stats::SummaryRowKind::kCount;
        if (!counts) {
            continue;
        }
        for (const auto& group_stats : row.groups) {
            if (!group_stats.n.has_value() || totals.count(group_stats.group) == 0) {
                continue;
            }
            auto& total = totals[group_stats.group];
            if (first_categorical != rows.end()) {
                total += *group_stats.n;
            } else {
                total = std::max(total, *group_stats.n);
            }
        }
    }
    return totals;
}

void ApplyPresentation(TableModel& model, const ReportOptions& options) {
    model.SetMissingText(options.missing_text);
    model.SetMarkStyle(options.mark_style);
}

std::vector<size_t> AllRowIds(const TableModel& model) {
    std::vector<size_t> ids;
    ids.reserve(model.Rows().size());
    for (const auto& row : model.Rows()) {
        ids.push_back(row.id);
    }
    return ids;
}

}  // namespace

absl::StatusOr<TableModel> BuildDemographicTable(
    const std::vector<stats::SummaryRow>& rows,
    const std::vector<std::string>& groups,
    const ReportOptions& options) {
    const DataFrame frame = stats::SummaryFrame(rows, groups);
    CLINTAB_ASSIGN_OR_RETURN(TableModel model,
                             TableModel::Bind(frame, stats::kLabelColumn,
                                              stats::kCategoryColumn));

    CLINTAB_RETURN_IF_ERROR(model.HideColumns(
        {std::string(stats::kVariableColumn), std::string(stats::kKindColumn)}));

    CLINTAB_RETURN_IF_ERROR(model.ApplyFormat(
        ColumnSelector::Prefix("n_"), RowFilter::All(),
        FormatRule::Integer(options.thousands_separator)));
    CLINTAB_RETURN_IF_ERROR(model.ApplyFormat(
        ColumnSelector::Prefix("pct_"), RowFilter::All(),
        FormatRule::Percent(options.pct_decimals)));
    CLINTAB_RETURN_IF_ERROR(model.ApplyFormat(
        ColumnSelector::Where([](const table::Column& column) {
            return column.id.rfind("mean_", 0) == 0 || column.id.rfind("median_", 0) == 0;
        }),
        RowFilter::All(), FormatRule::Fixed(options.mean_decimals)));
    CLINTAB_RETURN_IF_ERROR(model.ApplyFormat(
        ColumnSelector::Prefix("sd_"), RowFilter::All(),
        FormatRule::Fixed(options.sd_decimals)));

    const auto totals = GroupTotals(rows, groups);
    auto has = [&model](const std::string& id) { return model.FindColumn(id) != nullptr; };

    for (const auto& group : groups) {
        const std::string n = StatColumnId("n", group);
        const std::string pct = StatColumnId("pct", group);
        const std::string mean = StatColumnId("mean", group);
        const std::string sd = StatColumnId("sd", group);
        const std::string median = StatColumnId("median", group);
        const std::string min = StatColumnId("min", group);
        const std::string max = StatColumnId("max", group);

        if (has(n) && has(pct)) {
            CLINTAB_RETURN_IF_ERROR(
                model.MergeColumns({n, pct}, "{1} ({2})", RowFilter::NotMissing(pct)));
        }
        if (has(mean) && has(sd)) {
            CLINTAB_RETURN_IF_ERROR(model.MergeColumns({mean, sd}, "{1} ({2})"));
        }
        if (has(min) && has(max)) {
            CLINTAB_RETURN_IF_ERROR(model.MergeColumns({min, max}, "{1} - {2}"));
        }

        std::vector<std::string> sources;
        for (const auto& id : {n, mean, median, min}) {
            if (has(id)) {
                sources.push_back(id);
            }
        }
        if (sources.empty()) {
            continue;
        }

        const std::string label = absl::StrCat(group, " (N=", totals.at(group), ")");
        if (sources.size() == 1) {
            CLINTAB_RETURN_IF_ERROR(model.RelabelColumns({{sources.front(), label}}));
            CLINTAB_RETURN_IF_ERROR(
                model.SetAlignment(sources.front(), table::Alignment::kCenter));
        } else {
            CLINTAB_RETURN_IF_ERROR(
                model.CoalesceColumns(sources, StatColumnId("stat", group), label));
        }
    }

    CLINTAB_RETURN_IF_ERROR(model.IndentRows(AllRowIds(model), 1));
    model.SetStubHeader(std::string(kDemographicStubHeader));
    ApplyPresentation(model, options);

    CLINTAB_LOG_DEBUG("Demographic table: {} rows over {} groups", rows.size(),
                      groups.size());
    return model;
}

absl::StatusOr<TableModel> BuildResponseTable(
    const std::vector<stats::ResponseSummary>& rows,
    const std::vector<std::string>& groups,
    std::string_view treatment,
    std::string_view reference,
    const ReportOptions& options) {
    for (std::string_view arm : {treatment, reference}) {
        if (std::find(groups.begin(), groups.end(), arm) == groups.end()) {
            return UnknownReferenceError("group", arm);
        }
    }

    const DataFrame frame = stats::ResponseFrame(rows, groups);
    CLINTAB_ASSIGN_OR_RETURN(TableModel model,
                             TableModel::Bind(frame, stats::kSubgroupColumn));
    CLINTAB_RETURN_IF_ERROR(
        model.HideColumns({std::string(stats::kSubgroupVariableColumn)}));

    // Subgroup rows are grouped by their stratifying variable
    std::vector<std::string> variables;
    std::map<std::string, std::vector<size_t>> members;
    for (size_t i = 0; i < rows.size(); ++i) {
        const std::string& variable = rows[i].subgroup_variable;
        if (variable.empty()) {
            continue;
        }
        if (members.count(variable) == 0) {
            variables.push_back(variable);
        }
        members[variable].push_back(i);
    }
    for (const auto& variable : variables) {
        CLINTAB_RETURN_IF_ERROR(model.AddRowGroup(variable, members[variable]));
        CLINTAB_RETURN_IF_ERROR(model.IndentRows(members[variable], 1));
    }

    // Labels describe the level the intervals were computed at
    double confidence = options.confidence_level;
    if (!rows.empty()) {
        confidence = rows.front().confidence;
        for (const auto& row : rows) {
            if (row.confidence != confidence) {
                return InvalidArgumentError(absl::StrCat(
                    "Response rows mix confidence levels ", confidence, " and ",
                    row.confidence));
            }
        }
    }
    const std::string interval_label = ConfidenceLabel(confidence);
    const std::string interval_note = absl::StrCat(
        "Exact (Clopper-Pearson) ", interval_label, " of the event rate.");

    for (const auto& group : groups) {
        const std::string events = StatColumnId("events", group);
        const std::string total = StatColumnId("total", group);
        const std::string pct = StatColumnId("pct", group);
        const std::string lower = StatColumnId("lower", group);
        const std::string upper = StatColumnId("upper", group);

        CLINTAB_RETURN_IF_ERROR(model.ApplyFormat(
            ColumnSelector::Ids({events, total}), RowFilter::All(),
            FormatRule::Integer(options.thousands_separator)));
        CLINTAB_RETURN_IF_ERROR(model.ApplyFormat(
            ColumnSelector::Ids({pct, lower, upper}), RowFilter::All(),
            FormatRule::Percent(options.pct_decimals)));

        CLINTAB_RETURN_IF_ERROR(
            model.MergeColumns({events, total, pct}, "{1}/{2} ({3})"));
        CLINTAB_RETURN_IF_ERROR(model.MergeColumns({lower, upper}, "[{1}, {2}]"));

        CLINTAB_RETURN_IF_ERROR(
            model.RelabelColumns({{events, "n/N (%)"}, {lower, interval_label}}));
        CLINTAB_RETURN_IF_ERROR(model.AddSpanner(group, {events, lower}));
        CLINTAB_RETURN_IF_ERROR(
            model.AddFootnote(table::FootnoteLocation::ColumnLabel(lower), interval_note));
    }

    const std::string odds_ratio(stats::kOddsRatioColumn);
    const std::string odds_lower(stats::kOddsRatioLowerColumn);
    const std::string odds_upper(stats::kOddsRatioUpperColumn);

    CLINTAB_RETURN_IF_ERROR(model.ApplyFormat(
        ColumnSelector::Ids({odds_ratio, odds_lower, odds_upper}), RowFilter::All(),
        FormatRule::Fixed(options.ratio_decimals)));
    // Rows without an interval show the estimate alone
    CLINTAB_RETURN_IF_ERROR(model.MergeColumns({odds_ratio, odds_lower, odds_upper},
                                               "{1} ({2}, {3})",
                                               RowFilter::NotMissing(odds_lower)));
    CLINTAB_RETURN_IF_ERROR(model.RelabelColumns(
        {{odds_ratio, absl::StrCat("Odds ratio (", interval_label, ")")}}));
    CLINTAB_RETURN_IF_ERROR(model.AddSpanner(
        absl::StrCat(absl::string_view(treatment.data(), treatment.size()), " vs ", absl::string_view(reference.data(), reference.size())), {odds_ratio}));
    CLINTAB_RETURN_IF_ERROR(model.AddFootnote(
        table::FootnoteLocation::ColumnLabel(odds_ratio),
        absl::StrCat("Odds ratio of ", absl::string_view(treatment.data(), treatment.size()), " versus ",
                     absl::string_view(reference.data(), reference.size()),
                     " with Wald ", interval_label, " on the log scale.")));

    model.SetStubHeader(std::string(kResponseStubHeader));
    ApplyPresentation(model, options);

    CLINTAB_LOG_DEBUG("Response table: {} subgroup rows over {} groups", rows.size(),
                      groups.size());
    return model;
}

}  // namespace clintab::report
