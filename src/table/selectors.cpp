/// @file selectors.cpp
/// @brief Column selector and row filter resolution

#include "table/selectors.h"

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "table/table_model.h"

namespace clintab::table {

// =============================================================================
// ColumnSelector
// =============================================================================

ColumnSelector ColumnSelector::All() {
    return Where([](const Column&) { return true; });
}

ColumnSelector ColumnSelector::Ids(std::vector<std::string> ids) {
    ColumnSelector selector;
    selector.ids_ = std::move(ids);
    return selector;
}

ColumnSelector ColumnSelector::Prefix(std::string prefix) {
    return Where([prefix = std::move(prefix)](const Column& column) {
        return absl::StartsWith(column.id, prefix);
    });
}

ColumnSelector ColumnSelector::Suffix(std::string suffix) {
    return Where([suffix = std::move(suffix)](const Column& column) {
        return absl::EndsWith(column.id, suffix);
    });
}

ColumnSelector ColumnSelector::Where(Predicate predicate) {
    ColumnSelector selector;
    selector.predicate_ = std::move(predicate);
    return selector;
}

absl::StatusOr<std::vector<std::string>> ColumnSelector::Resolve(
    const TableModel& model) const {
    if (ids_.has_value()) {
        for (const auto& id : *ids_) {
            if (model.FindColumn(id) == nullptr) {
                return UnknownReferenceError("column", id);
            }
        }
        return *ids_;
    }

    std::vector<std::string> selected;
    for (const auto& column : model.Columns()) {
        if (predicate_ && predicate_(column)) {
            selected.push_back(column.id);
        }
    }
    return selected;
}

// =============================================================================
// RowFilter
// =============================================================================

RowFilter RowFilter::All() {
    return Where([](const TableModel&, const Row&) { return true; });
}

RowFilter RowFilter::Ids(std::vector<size_t> ids) {
    RowFilter filter;
    filter.ids_ = std::move(ids);
    return filter;
}

RowFilter RowFilter::InGroup(std::string group) {
    return Where([group = std::move(group)](const TableModel&, const Row& row) {
        return row.group.has_value() && *row.group == group;
    });
}

RowFilter RowFilter::StubEquals(std::string stub) {
    return Where([stub = std::move(stub)](const TableModel&, const Row& row) {
        return row.stub == stub;
    });
}

RowFilter RowFilter::NotMissing(std::string column_id) {
    RowFilter filter;
    filter.column_ = column_id;
    filter.predicate_ = [column_id = std::move(column_id)](const TableModel& model,
                                                           const Row& row) {
        return !IsMissing(model.CellValue(row.id, column_id));
    };
    return filter;
}

RowFilter RowFilter::Where(Predicate predicate) {
    RowFilter filter;
    filter.predicate_ = std::move(predicate);
    return filter;
}

absl::StatusOr<std::vector<bool>> RowFilter::Resolve(const TableModel& model) const {
    const auto& rows = model.Rows();
    std::vector<bool> mask(rows.size(), false);

    if (ids_.has_value()) {
        for (size_t id : *ids_) {
            if (id >= rows.size()) {
                return UnknownReferenceError("row", absl::StrCat(id));
            }
            mask[id] = true;
        }
        return mask;
    }

    if (column_.has_value() && model.FindColumn(*column_) == nullptr) {
        return UnknownReferenceError("column", *column_);
    }

    for (const auto& row : rows) {
        mask[row.id] = predicate_ && predicate_(model, row);
    }
    return mask;
}

}  // namespace clintab::table
