/// @file table_model.cpp
/// @brief TableModel transformations

#include "table/table_model.h"

#include <algorithm>
#include <set>
#include <string_view>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace clintab::table {

namespace {

constexpr size_t kMinMergeSources = 2;
constexpr size_t kMaxMergeSources = 4;

std::string StubText(const Value& value) {
    return CategoryKey(value).value_or("");
}

}  // namespace

// =============================================================================
// Bind
// =============================================================================

absl::StatusOr<TableModel> TableModel::Bind(const DataFrame& frame,
                                            std::string_view stub_column,
                                            std::string_view group_column) {
    if (!frame.ColumnIndex(stub_column).has_value()) {
        return UnknownReferenceError("stub column", stub_column);
    }
    if (!group_column.empty() && !frame.ColumnIndex(group_column).has_value()) {
        return UnknownReferenceError("group column", group_column);
    }

    std::set<std::string_view> seen;
    for (const auto& name : frame.Columns()) {
        if (!seen.insert(name).second) {
            CLINTAB_LOG_WARN("Bind rejected: duplicate column {}", name);
            return InvalidArgumentError(absl::StrCat("Duplicate column id: ", name));
        }
    }

    TableModel model;
    model.data_ = frame;

    for (const auto& name : frame.Columns()) {
        if (name == stub_column || (!group_column.empty() && name == group_column)) {
            continue;
        }
        Column column;
        column.id = name;
        column.label = name;
        model.columns_.push_back(std::move(column));
    }

    model.rows_.reserve(frame.NumRows());
    for (size_t i = 0; i < frame.NumRows(); ++i) {
        Row row;
        row.id = i;
        row.stub = StubText(frame.At(i, stub_column));
        if (!group_column.empty()) {
            auto group = CategoryKey(frame.At(i, group_column));
            if (group.has_value()) {
                if (std::find(model.row_groups_.begin(), model.row_groups_.end(),
                              *group) == model.row_groups_.end()) {
                    model.row_groups_.push_back(*group);
                }
                row.group = std::move(group);
            }
        }
        model.rows_.push_back(std::move(row));
    }

    CLINTAB_LOG_DEBUG("Bound table: {} rows, {} columns, {} row groups",
                      model.rows_.size(), model.columns_.size(),
                      model.row_groups_.size());
    return model;
}

// =============================================================================
// Lookup
// =============================================================================

const Column* TableModel::FindColumn(std::string_view id) const {
    for (const auto& column : columns_) {
        if (column.id == id) {
            return &column;
        }
    }
    return nullptr;
}

Column* TableModel::MutableColumn(std::string_view id) {
    for (auto& column : columns_) {
        if (column.id == id) {
            return &column;
        }
    }
    return nullptr;
}

const Value& TableModel::CellValue(size_t row_id, std::string_view column_id) const {
    return data_.At(row_id, column_id);
}

std::string TableModel::DisplayColumn(std::string_view id) const {
    std::string current(id);
    // Chains are acyclic: a column can only be absorbed once
    for (size_t hops = 0; hops <= columns_.size(); ++hops) {
        const Column* column = FindColumn(current);
        if (column == nullptr || column->merged_into.empty()) {
            break;
        }
        current = column->merged_into;
    }
    return current;
}

absl::Status TableModel::CheckColumnsExist(const std::vector<std::string>& ids) const {
    for (const auto& id : ids) {
        if (FindColumn(id) == nullptr) {
            return UnknownReferenceError("column", id);
        }
    }
    return absl::OkStatus();
}

absl::Status TableModel::CheckRowsExist(const std::vector<size_t>& ids) const {
    for (size_t id : ids) {
        if (id >= rows_.size()) {
            return UnknownReferenceError("row", absl::StrCat(id));
        }
    }
    return absl::OkStatus();
}

absl::Status TableModel::Reject(absl::Status status, std::string_view operation) const {
    CLINTAB_LOG_WARN("{} rejected: {}", operation,
                     std::string_view(status.message().data(), status.message().size()));
    return status;
}

// =============================================================================
// Transformations
// =============================================================================

absl::Status TableModel::ApplyFormat(const ColumnSelector& columns, const RowFilter& rows,
                                     const FormatRule& rule) {
    auto column_ids = columns.Resolve(*this);
    if (!column_ids.ok()) {
        return Reject(column_ids.status(), "ApplyFormat");
    }
    auto mask = rows.Resolve(*this);
    if (!mask.ok()) {
        return Reject(mask.status(), "ApplyFormat");
    }
    if (rule.decimals < 0) {
        return Reject(InvalidArgumentError(absl::StrCat(
                          "Negative decimal count: ", rule.decimals)),
                      "ApplyFormat");
    }

    format_rules_.push_back({*std::move(column_ids), *std::move(mask), rule});
    return absl::OkStatus();
}

absl::Status TableModel::MergeColumns(const std::vector<std::string>& source_ids,
                                      std::string_view pattern, const RowFilter& rows) {
    if (source_ids.size() < kMinMergeSources || source_ids.size() > kMaxMergeSources) {
        return Reject(InvalidMergePatternError(absl::StrCat(
                          "Merge needs ", kMinMergeSources, "-", kMaxMergeSources,
                          " source columns, got ", source_ids.size())),
                      "MergeColumns");
    }
    if (auto status = CheckColumnsExist(source_ids); !status.ok()) {
        return Reject(status, "MergeColumns");
    }

    std::set<std::string> distinct(source_ids.begin(), source_ids.end());
    if (distinct.size() != source_ids.size()) {
        return Reject(InvalidArgumentError(absl::StrCat(
                          "Duplicate merge source in [",
                          absl::StrJoin(source_ids, ", "), "]")),
                      "MergeColumns");
    }

    for (const auto& id : source_ids) {
        const Column* column = FindColumn(id);
        if (!column->merged_into.empty()) {
            return Reject(MakeError(ErrorCode::kColumnAlreadyMerged,
                                    absl::StrCat("Column ", id, " is already merged into ",
                                                 column->merged_into)),
                          "MergeColumns");
        }
        if (column->synthetic) {
            return Reject(InvalidArgumentError(absl::StrCat(
                              "Coalesced column ", id, " cannot be a merge source")),
                          "MergeColumns");
        }
    }

    if (auto status = ValidatePattern(pattern, source_ids.size()); !status.ok()) {
        return Reject(status, "MergeColumns");
    }

    auto mask = rows.Resolve(*this);
    if (!mask.ok()) {
        return Reject(mask.status(), "MergeColumns");
    }

    for (size_t i = 1; i < source_ids.size(); ++i) {
        MutableColumn(source_ids[i])->merged_into = source_ids.front();
    }
    merge_rules_.push_back({source_ids, std::string(pattern), *std::move(mask)});

    CLINTAB_LOG_DEBUG("Merged [{}] into {} with \"{}\"", absl::StrJoin(source_ids, ", "),
                      source_ids.front(), pattern);
    return absl::OkStatus();
}

absl::Status TableModel::CoalesceColumns(const std::vector<std::string>& source_ids,
                                         std::string_view output_id,
                                         std::string_view label) {
    if (source_ids.size() < 2) {
        return Reject(InvalidArgumentError("Coalesce needs at least two source columns"),
                      "CoalesceColumns");
    }
    if (auto status = CheckColumnsExist(source_ids); !status.ok()) {
        return Reject(status, "CoalesceColumns");
    }
    if (output_id.empty() || FindColumn(output_id) != nullptr) {
        return Reject(InvalidArgumentError(absl::StrCat(
                          "Coalesce output id is empty or taken: \"", absl::string_view(output_id.data(), output_id.size()), "\"")),
                      "CoalesceColumns");
    }
    for (const auto& id : source_ids) {
        const Column* column = FindColumn(id);
        if (!column->merged_into.empty()) {
            return Reject(MakeError(ErrorCode::kColumnAlreadyMerged,
                                    absl::StrCat("Column ", id, " is already merged into ",
                                                 column->merged_into)),
                          "CoalesceColumns");
        }
    }

    const std::string first = source_ids.front();
    auto position = std::find_if(columns_.begin(), columns_.end(),
                                 [&first](const Column& c) { return c.id == first; });

    Column output;
    output.id = std::string(output_id);
    output.label = std::string(label);
    output.alignment = Alignment::kCenter;
    output.synthetic = true;
    columns_.insert(position, std::move(output));

    for (const auto& id : source_ids) {
        MutableColumn(id)->merged_into = std::string(output_id);
    }
    coalesce_rules_.push_back({source_ids, std::string(output_id)});
    return absl::OkStatus();
}

absl::Status TableModel::AddSpanner(std::string_view label,
                                    const std::vector<std::string>& column_ids, int level) {
    if (column_ids.empty()) {
        return Reject(InvalidArgumentError("Spanner needs at least one column"),
                      "AddSpanner");
    }
    if (level < 0) {
        return Reject(InvalidArgumentError(absl::StrCat("Negative spanner level: ", level)),
                      "AddSpanner");
    }
    if (auto status = CheckColumnsExist(column_ids); !status.ok()) {
        return Reject(status, "AddSpanner");
    }

    for (const auto& spanner : spanners_) {
        if (spanner.level != level) {
            continue;
        }
        for (const auto& id : column_ids) {
            if (std::find(spanner.column_ids.begin(), spanner.column_ids.end(), id) !=
                spanner.column_ids.end()) {
                return Reject(MakeError(ErrorCode::kSpannerConflict,
                                        absl::StrCat("Column ", id, " already under spanner \"",
                                                     spanner.label, "\" at level ", level)),
                              "AddSpanner");
            }
        }
    }

    spanners_.push_back({std::string(label), level, column_ids});
    return absl::OkStatus();
}

absl::Status TableModel::AddRowGroup(std::string_view label,
                                     const std::vector<size_t>& row_ids) {
    if (auto status = CheckRowsExist(row_ids); !status.ok()) {
        return Reject(status, "AddRowGroup");
    }

    std::string group(label);
    if (std::find(row_groups_.begin(), row_groups_.end(), group) == row_groups_.end()) {
        row_groups_.push_back(group);
    }
    for (size_t id : row_ids) {
        rows_[id].group = group;
    }
    return absl::OkStatus();
}

absl::Status TableModel::SetWidth(std::string_view column_id, int width) {
    Column* column = MutableColumn(column_id);
    if (column == nullptr) {
        return Reject(UnknownReferenceError("column", column_id), "SetWidth");
    }
    if (width <= 0) {
        return Reject(InvalidArgumentError(absl::StrCat("Width must be positive: ", width)),
                      "SetWidth");
    }
    column->width = width;
    return absl::OkStatus();
}

absl::Status TableModel::SetAlignment(std::string_view column_id, Alignment alignment) {
    Column* column = MutableColumn(column_id);
    if (column == nullptr) {
        return Reject(UnknownReferenceError("column", column_id), "SetAlignment");
    }
    column->alignment = alignment;
    return absl::OkStatus();
}

absl::Status TableModel::RelabelColumns(const std::map<std::string, std::string>& labels) {
    for (const auto& [id, label] : labels) {
        if (FindColumn(id) == nullptr) {
            return Reject(UnknownReferenceError("column", id), "RelabelColumns");
        }
    }
    for (const auto& [id, label] : labels) {
        MutableColumn(id)->label = label;
    }
    return absl::OkStatus();
}

absl::Status TableModel::IndentRows(const std::vector<size_t>& row_ids, int level) {
    if (auto status = CheckRowsExist(row_ids); !status.ok()) {
        return Reject(status, "IndentRows");
    }
    if (level < 0) {
        return Reject(InvalidArgumentError(absl::StrCat("Negative indent: ", level)),
                      "IndentRows");
    }
    for (size_t id : row_ids) {
        rows_[id].indent = level;
    }
    return absl::OkStatus();
}

absl::Status TableModel::HideColumns(const std::vector<std::string>& column_ids) {
    if (auto status = CheckColumnsExist(column_ids); !status.ok()) {
        return Reject(status, "HideColumns");
    }
    for (const auto& id : column_ids) {
        MutableColumn(id)->hidden = true;
    }
    return absl::OkStatus();
}

absl::Status TableModel::AddFootnote(const FootnoteLocation& location,
                                     std::string_view text) {
    using Kind = FootnoteLocation::Kind;

    if (location.kind == Kind::kColumnLabel || location.kind == Kind::kCell) {
        if (FindColumn(location.column_id) == nullptr) {
            return Reject(UnknownReferenceError("column", location.column_id),
                          "AddFootnote");
        }
    }
    if (location.kind == Kind::kStub || location.kind == Kind::kCell) {
        if (location.row_id >= rows_.size()) {
            return Reject(UnknownReferenceError("row", absl::StrCat(location.row_id)),
                          "AddFootnote");
        }
    }

    footnotes_.push_back({location, std::string(text)});
    return absl::OkStatus();
}

void TableModel::SetTitle(std::string title, std::string subtitle) {
    title_ = std::move(title);
    subtitle_ = std::move(subtitle);
}

}  // namespace clintab::table
