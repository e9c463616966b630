/// @file grid.cpp
/// @brief Grid equality, text view and JSON export

#include "table/grid.h"

namespace clintab::table {

namespace {

nlohmann::json CellToJson(const GridCell& cell) {
    return {{"text", cell.text}, {"marks", cell.marks}};
}

std::string_view RowKindToString(GridRowKind kind) {
    return kind == GridRowKind::kGroupHeader ? "group_header" : "data";
}

}  // namespace

bool Grid::operator==(const Grid& other) const {
    return title == other.title && subtitle == other.subtitle &&
           stub_header == other.stub_header && stub_width == other.stub_width &&
           header_rows == other.header_rows && columns == other.columns &&
           body == other.body && footnotes == other.footnotes;
}

std::vector<std::vector<std::string>> Grid::BodyText() const {
    std::vector<std::vector<std::string>> text;
    for (const auto& row : body) {
        if (row.kind != GridRowKind::kData) {
            continue;
        }
        std::vector<std::string> line;
        line.reserve(row.cells.size());
        for (const auto& cell : row.cells) {
            line.push_back(cell.text);
        }
        text.push_back(std::move(line));
    }
    return text;
}

nlohmann::json Grid::ToJson() const {
    nlohmann::json j;
    j["title"] = CellToJson(title);
    j["subtitle"] = subtitle;
    j["stub_header"] = CellToJson(stub_header);
    j["stub_width"] = stub_width;

    j["header_rows"] = nlohmann::json::array();
    for (const auto& header_row : header_rows) {
        nlohmann::json row = nlohmann::json::array();
        for (const auto& cell : header_row) {
            row.push_back({{"text", cell.text}, {"span", cell.span}, {"marks", cell.marks}});
        }
        j["header_rows"].push_back(std::move(row));
    }

    j["columns"] = nlohmann::json::array();
    for (const auto& column : columns) {
        j["columns"].push_back({
            {"id", column.id},
            {"width", column.width},
            {"alignment", std::string(AlignmentToString(column.alignment))}
        });
    }

    j["body"] = nlohmann::json::array();
    for (const auto& row : body) {
        nlohmann::json cells = nlohmann::json::array();
        for (const auto& cell : row.cells) {
            cells.push_back(CellToJson(cell));
        }
        nlohmann::json entry = {
            {"kind", std::string(RowKindToString(row.kind))},
            {"stub", CellToJson(row.stub)},
            {"indent", row.indent},
            {"cells", std::move(cells)}
        };
        if (row.row_id.has_value()) {
            entry["row_id"] = *row.row_id;
        }
        j["body"].push_back(std::move(entry));
    }

    j["footnotes"] = nlohmann::json::array();
    for (const auto& footnote : footnotes) {
        j["footnotes"].push_back({{"mark", footnote.mark}, {"text", footnote.text}});
    }
    return j;
}

}  // namespace clintab::table
