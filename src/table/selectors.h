#pragma once

/// @file selectors.h
/// @brief Column and row selection for table transformations
///
/// Selectors are predicates evaluated once, when a transformation is
/// applied; the resolved ids are what the model stores. Later structural
/// changes (relabels, merges) never re-run a selector.

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "table/table_types.h"

namespace clintab::table {

class TableModel;

/// @brief Selects columns by id or column metadata
class ColumnSelector {
public:
    using Predicate = std::function<bool(const Column&)>;

    /// @brief Every column, hidden ones included
    static ColumnSelector All();

    /// @brief Exactly these ids; resolving fails on an unknown id
    static ColumnSelector Ids(std::vector<std::string> ids);

    /// @brief Columns whose id starts with prefix
    static ColumnSelector Prefix(std::string prefix);

    /// @brief Columns whose id ends with suffix
    static ColumnSelector Suffix(std::string suffix);

    /// @brief Columns satisfying an arbitrary predicate
    static ColumnSelector Where(Predicate predicate);

    /// @brief Ids of the selected columns, in model order
    absl::StatusOr<std::vector<std::string>> Resolve(const TableModel& model) const;

private:
    ColumnSelector() = default;

    Predicate predicate_;
    std::optional<std::vector<std::string>> ids_;
};

/// @brief Selects body rows
class RowFilter {
public:
    using Predicate = std::function<bool(const TableModel&, const Row&)>;

    static RowFilter All();

    /// @brief Exactly these row ids; resolving fails on an unknown id
    static RowFilter Ids(std::vector<size_t> ids);

    /// @brief Rows belonging to a row group
    static RowFilter InGroup(std::string group);

    /// @brief Rows whose stub text equals stub
    static RowFilter StubEquals(std::string stub);

    /// @brief Rows whose underlying value in column_id is not missing
    static RowFilter NotMissing(std::string column_id);

    static RowFilter Where(Predicate predicate);

    /// @brief Membership mask indexed by row id
    absl::StatusOr<std::vector<bool>> Resolve(const TableModel& model) const;

private:
    RowFilter() = default;

    Predicate predicate_;
    std::optional<std::vector<size_t>> ids_;
    std::optional<std::string> column_;
};

}  // namespace clintab::table
