#pragma once

/// @file table_types.h
/// @brief Structural pieces of a table model

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clintab::table {

/// @brief Horizontal alignment of a column
enum class Alignment {
    kAuto,  ///< Right for numeric data, left otherwise
    kLeft,
    kCenter,
    kRight
};

std::string_view AlignmentToString(Alignment alignment);

/// @brief A data column
struct Column {
    std::string id;
    std::string label;
    bool hidden = false;
    std::optional<int> width;
    Alignment alignment = Alignment::kAuto;

    /// Created by CoalesceColumns; holds no values of its own
    bool synthetic = false;

    /// Column that absorbed this one through a merge or coalesce, if any
    std::string merged_into;
};

/// @brief A body row; ids are positions in the bound data
struct Row {
    size_t id = 0;
    std::string stub;
    int indent = 0;
    std::optional<std::string> group;
};

/// @brief Header label spanning several columns at one level
struct Spanner {
    std::string label;
    int level = 0;
    std::vector<std::string> column_ids;
};

/// @brief Where a footnote mark is placed
struct FootnoteLocation {
    enum class Kind { kTitle, kColumnLabel, kStub, kCell };

    Kind kind = Kind::kTitle;
    std::string column_id;
    size_t row_id = 0;

    static FootnoteLocation Title() { return {}; }
    static FootnoteLocation ColumnLabel(std::string column_id) {
        return {Kind::kColumnLabel, std::move(column_id), 0};
    }
    static FootnoteLocation Stub(size_t row_id) {
        return {Kind::kStub, "", row_id};
    }
    static FootnoteLocation Cell(size_t row_id, std::string column_id) {
        return {Kind::kCell, std::move(column_id), row_id};
    }
};

struct Footnote {
    FootnoteLocation location;
    std::string text;
};

}  // namespace clintab::table
