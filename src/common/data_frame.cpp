/// @file data_frame.cpp
/// @brief DataFrame storage

#include "data_frame.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

namespace clintab {

DataFrame::DataFrame(std::vector<std::string> columns)
    : columns_(std::move(columns)) {}

std::optional<size_t> DataFrame::ColumnIndex(std::string_view name) const {
    auto it = std::find(columns_.begin(), columns_.end(), name);
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - columns_.begin());
}

size_t DataFrame::AddColumn(std::string name) {
    if (auto existing = ColumnIndex(name)) {
        return *existing;
    }
    columns_.push_back(std::move(name));
    for (auto& row : rows_) {
        row.emplace_back();
    }
    return columns_.size() - 1;
}

size_t DataFrame::AddRow() {
    rows_.emplace_back(columns_.size());
    return rows_.size() - 1;
}

void DataFrame::Set(size_t row, std::string_view column, Value value) {
    const size_t index = AddColumn(std::string(column));
    rows_.at(row)[index] = std::move(value);
}

const Value& DataFrame::At(size_t row, std::string_view column) const {
    static const Value kMissing;
    auto index = ColumnIndex(column);
    if (!index.has_value()) {
        return kMissing;
    }
    return rows_.at(row)[*index];
}

absl::Status DataFrame::AppendRow(std::vector<Value> row) {
    if (row.size() != columns_.size()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Row has ", row.size(), " values, frame has ", columns_.size(), " columns"));
    }
    rows_.push_back(std::move(row));
    return absl::OkStatus();
}

}  // namespace clintab
