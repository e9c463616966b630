/// @file aggregator.cpp
/// @brief Summary orchestration

#include "stats/aggregator.h"

#include <algorithm>
#include <type_traits>
#include <variant>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace clintab::stats {

namespace {

bool IsEvent(const Value& value, const std::optional<std::string>& event_key) {
    auto key = CategoryKey(value);
    return key.has_value() && event_key.has_value() && *key == *event_key;
}

absl::StatusOr<ResponseSummary> SummarizeSubset(
    const std::vector<const SubjectRecord*>& subset,
    const ResponseOptions& options,
    const std::vector<std::string>& groups) {

    const auto event_key = CategoryKey(options.event_value);

    ResponseSummary summary;
    summary.confidence = options.confidence;
    for (const auto& group : groups) {
        GroupResponse response;
        response.group = group;
        for (const SubjectRecord* record : subset) {
            if (CategoryKey(record->Get(options.group_var)) != group) {
                continue;
            }
            const Value& value = record->Get(options.response_var);
            if (IsMissing(value)) {
                continue;
            }
            ++response.total;
            if (IsEvent(value, event_key)) {
                ++response.events;
            }
        }
        if (response.total > 0) {
            response.pct = static_cast<double>(response.events) /
                           static_cast<double>(response.total);
        }
        CLINTAB_ASSIGN_OR_RETURN(response.interval,
                                 ClopperPearson(response.events, response.total,
                                                options.confidence));
        summary.groups.push_back(std::move(response));
    }

    const GroupResponse* treatment = summary.ForGroup(options.treatment_group);
    const GroupResponse* reference = summary.ForGroup(options.reference_group);
    CLINTAB_ASSIGN_OR_RETURN(summary.odds_ratio,
                             OddsRatioCI(treatment->events, treatment->total,
                                         reference->events, reference->total,
                                         options.confidence));
    return summary;
}

}  // namespace

absl::StatusOr<std::vector<SummaryRow>> Aggregate(
    const std::vector<SubjectRecord>& records,
    std::string_view group_var,
    const std::vector<VariableSpec>& variables,
    const std::vector<std::string>& groups) {

    const std::vector<std::string> group_order =
        groups.empty() ? GroupLevels(records, group_var) : groups;

    std::vector<SummaryRow> summary;
    for (const auto& variable : variables) {
        absl::StatusOr<std::vector<SummaryRow>> rows = std::visit(
            [&](const auto& type) -> absl::StatusOr<std::vector<SummaryRow>> {
                using T = std::decay_t<decltype(type)>;
                if constexpr (std::is_same_v<T, CategoricalType>) {
                    return SummarizeCategorical(records, group_var, variable.name,
                                                type, group_order);
                } else if constexpr (std::is_same_v<T, ContinuousType>) {
                    return SummarizeContinuous(records, group_var, variable.name,
                                               group_order);
                } else {
                    return UnknownVariableTypeError(variable.name);
                }
            },
            variable.type);

        if (!rows.ok()) {
            CLINTAB_LOG_WARN("Aggregation of {} failed: {}", variable.name,
                             std::string_view(rows.status().message().data(),
                                              rows.status().message().size()));
            return rows.status();
        }

        const std::string category = variable.CategoryLabel();
        for (auto& row : *rows) {
            row.category = category;
            summary.push_back(std::move(row));
        }
    }

    CLINTAB_LOG_DEBUG("Aggregated {} variables into {} summary rows",
                      variables.size(), summary.size());
    return summary;
}

const GroupResponse* ResponseSummary::ForGroup(std::string_view group) const {
    for (const auto& response : groups) {
        if (response.group == group) {
            return &response;
        }
    }
    return nullptr;
}

absl::StatusOr<std::vector<ResponseSummary>> SummarizeResponse(
    const std::vector<SubjectRecord>& records,
    const ResponseOptions& options) {

    if (options.group_var.empty() || options.response_var.empty()) {
        return absl::InvalidArgumentError("Group and response variables are required");
    }
    if (IsMissing(options.event_value)) {
        return absl::InvalidArgumentError("Event value must not be missing");
    }

    const std::vector<std::string> groups =
        options.groups.empty() ? GroupLevels(records, options.group_var) : options.groups;

    for (const std::string* id : {&options.treatment_group, &options.reference_group}) {
        if (std::find(groups.begin(), groups.end(), *id) == groups.end()) {
            return UnknownReferenceError("group", *id);
        }
    }

    std::vector<const SubjectRecord*> all;
    all.reserve(records.size());
    for (const auto& record : records) {
        all.push_back(&record);
    }

    std::vector<ResponseSummary> rows;
    CLINTAB_ASSIGN_OR_RETURN(ResponseSummary overall, SummarizeSubset(all, options, groups));
    overall.subgroup = options.overall_label;
    rows.push_back(std::move(overall));

    if (!options.subgroup_var.empty()) {
        for (const auto& level : GroupLevels(records, options.subgroup_var)) {
            std::vector<const SubjectRecord*> subset;
            for (const SubjectRecord* record : all) {
                if (CategoryKey(record->Get(options.subgroup_var)) == level) {
                    subset.push_back(record);
                }
            }
            CLINTAB_ASSIGN_OR_RETURN(ResponseSummary row,
                                     SummarizeSubset(subset, options, groups));
            row.subgroup_variable = options.subgroup_var;
            row.subgroup = level;
            rows.push_back(std::move(row));
        }
    }

    CLINTAB_LOG_DEBUG("Response summary of {}: {} rows", options.response_var, rows.size());
    return rows;
}

}  // namespace clintab::stats
