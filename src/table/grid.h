#pragma once

/// @file grid.h
/// @brief Rendered table handed to display writers

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "table/table_types.h"

namespace clintab::table {

/// @brief Finalized text plus the footnote marks attached to it
struct GridCell {
    std::string text;
    std::vector<std::string> marks;

    bool operator==(const GridCell& other) const {
        return text == other.text && marks == other.marks;
    }
};

/// @brief Header cell spanning one or more visible columns
struct HeaderCell {
    std::string text;
    size_t span = 1;
    std::vector<std::string> marks;

    bool operator==(const HeaderCell& other) const {
        return text == other.text && span == other.span && marks == other.marks;
    }
};

enum class GridRowKind {
    kGroupHeader,
    kData
};

struct GridRow {
    GridRowKind kind = GridRowKind::kData;
    GridCell stub;
    int indent = 0;
    std::vector<GridCell> cells;
    std::optional<size_t> row_id;  ///< Model row id; empty for group headers

    bool operator==(const GridRow& other) const {
        return kind == other.kind && stub == other.stub && indent == other.indent &&
               cells == other.cells && row_id == other.row_id;
    }
};

struct ColumnLayout {
    std::string id;
    size_t width = 0;
    Alignment alignment = Alignment::kLeft;

    bool operator==(const ColumnLayout& other) const {
        return id == other.id && width == other.width && alignment == other.alignment;
    }
};

struct FootnoteEntry {
    std::string mark;
    std::string text;

    bool operator==(const FootnoteEntry& other) const {
        return mark == other.mark && text == other.text;
    }
};

/// @brief Display grid: title block, headers, body, footnotes
///
/// header_rows holds one row per spanner level (highest first) followed by
/// the column label row. Every header row covers the visible columns; the
/// stub column is described by stub_header and stub_width.
struct Grid {
    GridCell title;
    std::string subtitle;
    GridCell stub_header;
    size_t stub_width = 0;
    std::vector<std::vector<HeaderCell>> header_rows;
    std::vector<ColumnLayout> columns;
    std::vector<GridRow> body;
    std::vector<FootnoteEntry> footnotes;

    bool operator==(const Grid& other) const;
    bool operator!=(const Grid& other) const { return !(*this == other); }

    /// @brief Data rows only, as text
    std::vector<std::vector<std::string>> BodyText() const;

    /// @brief Export for downstream writers
    nlohmann::json ToJson() const;
};

}  // namespace clintab::table
