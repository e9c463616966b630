#pragma once

/// @file data_frame.h
/// @brief Minimal long-form table exchanged between aggregation and layout

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>

#include "common/value.h"

namespace clintab {

/// @brief Named columns over rows of values
class DataFrame {
public:
    DataFrame() = default;
    explicit DataFrame(std::vector<std::string> columns);

    const std::vector<std::string>& Columns() const { return columns_; }
    const std::vector<std::vector<Value>>& Rows() const { return rows_; }
    size_t NumRows() const { return rows_.size(); }

    /// @brief Index of a column, nullopt if absent
    std::optional<size_t> ColumnIndex(std::string_view name) const;

    /// @brief Append a column filled with missing values; no-op if present
    size_t AddColumn(std::string name);

    /// @brief Append an empty row and return its index
    size_t AddRow();

    /// @brief Set a cell, adding the column if needed
    void Set(size_t row, std::string_view column, Value value);

    /// @brief Cell value; missing if the column is absent
    const Value& At(size_t row, std::string_view column) const;

    /// @brief Append a full row; its size must match the column count
    absl::Status AppendRow(std::vector<Value> row);

private:
    std::vector<std::string> columns_;
    std::vector<std::vector<Value>> rows_;
};

}  // namespace clintab
