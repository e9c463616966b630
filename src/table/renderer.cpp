/// @file renderer.cpp
/// @brief Grid rendering

#include "table/renderer.h"

#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <unordered_map>

#include "common/logging.h"

namespace clintab::table {

namespace {

using CellKey = std::pair<size_t, std::string>;

/// Text and value presence of every column, hidden ones included
struct CellText {
    std::unordered_map<std::string, std::vector<std::string>> text;
    std::unordered_map<std::string, std::vector<bool>> present;
};

/// Footnote marks resolved to the elements that display them
struct MarkIndex {
    std::vector<std::string> title;
    std::map<std::string, std::vector<std::string>> column_labels;
    std::map<size_t, std::vector<std::string>> stubs;
    std::map<CellKey, std::vector<std::string>> cells;
    std::vector<FootnoteEntry> entries;
};

void AddMark(std::vector<std::string>& marks, const std::string& mark) {
    if (std::find(marks.begin(), marks.end(), mark) == marks.end()) {
        marks.push_back(mark);
    }
}

template <typename Map, typename Key>
std::vector<std::string> MarksAt(const Map& map, const Key& key) {
    auto it = map.find(key);
    return it == map.end() ? std::vector<std::string>{} : it->second;
}

std::string FormatValue(const TableModel& model, const Value& value,
                        const std::vector<const FormatAssignment*>& rules, size_t row_id) {
    if (IsMissing(value)) {
        return model.MissingText();
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }

    const double number = std::get<double>(value);
    // Last matching rule wins
    for (auto it = rules.rbegin(); it != rules.rend(); ++it) {
        if (row_id < (*it)->rows.size() && (*it)->rows[row_id]) {
            return FormatNumber(number, (*it)->rule);
        }
    }
    return DefaultNumberText(number);
}

CellText BuildCellText(const TableModel& model) {
    const size_t row_count = model.Rows().size();
    CellText cells;

    for (const auto& column : model.Columns()) {
        auto& text = cells.text[column.id];
        auto& present = cells.present[column.id];
        text.assign(row_count, model.MissingText());
        present.assign(row_count, false);
        if (column.synthetic) {
            continue;
        }

        std::vector<const FormatAssignment*> rules;
        for (const auto& rule : model.FormatRules()) {
            if (std::find(rule.column_ids.begin(), rule.column_ids.end(), column.id) !=
                rule.column_ids.end()) {
                rules.push_back(&rule);
            }
        }

        for (const auto& row : model.Rows()) {
            const Value& value = model.CellValue(row.id, column.id);
            text[row.id] = FormatValue(model, value, rules, row.id);
            present[row.id] = !IsMissing(value);
        }
    }

    for (const auto& merge : model.MergeRules()) {
        auto& slot = cells.text[merge.source_ids.front()];
        for (size_t row_id = 0; row_id < row_count; ++row_id) {
            if (row_id >= merge.rows.size() || !merge.rows[row_id]) {
                continue;
            }
            std::vector<std::string> values;
            values.reserve(merge.source_ids.size());
            for (const auto& source : merge.source_ids) {
                values.push_back(cells.text[source][row_id]);
            }
            slot[row_id] = SubstitutePattern(merge.pattern, values);
        }
    }

    for (const auto& coalesce : model.CoalesceRules()) {
        auto& text = cells.text[coalesce.output_id];
        auto& present = cells.present[coalesce.output_id];
        for (size_t row_id = 0; row_id < row_count; ++row_id) {
            for (const auto& source : coalesce.source_ids) {
                if (cells.present[source][row_id]) {
                    text[row_id] = cells.text[source][row_id];
                    present[row_id] = true;
                    break;
                }
            }
        }
    }
    return cells;
}

MarkIndex BuildMarks(const TableModel& model) {
    using Kind = FootnoteLocation::Kind;
    MarkIndex index;
    std::map<std::string, std::string> mark_by_text;

    for (const auto& footnote : model.Footnotes()) {
        auto [it, inserted] = mark_by_text.emplace(footnote.text, "");
        if (inserted) {
            it->second = FootnoteMark(index.entries.size(), model.GetMarkStyle());
            index.entries.push_back({it->second, footnote.text});
        }
        const std::string& mark = it->second;

        const auto& location = footnote.location;
        switch (location.kind) {
            case Kind::kTitle:
                AddMark(index.title, mark);
                break;
            case Kind::kColumnLabel:
                AddMark(index.column_labels[model.DisplayColumn(location.column_id)], mark);
                break;
            case Kind::kStub:
                AddMark(index.stubs[location.row_id], mark);
                break;
            case Kind::kCell:
                AddMark(index.cells[{location.row_id,
                                     model.DisplayColumn(location.column_id)}],
                        mark);
                break;
        }
    }
    return index;
}

/// Right for numbers, left for text; synthetic columns look at their sources
bool IsNumericColumn(const TableModel& model, const Column& column) {
    std::vector<std::string> ids;
    if (column.synthetic) {
        for (const auto& rule : model.CoalesceRules()) {
            if (rule.output_id == column.id) {
                ids = rule.source_ids;
            }
        }
    } else {
        ids.push_back(column.id);
    }

    bool any_number = false;
    for (const auto& id : ids) {
        for (const auto& row : model.Rows()) {
            const Value& value = model.CellValue(row.id, id);
            if (std::holds_alternative<std::string>(value)) {
                return false;
            }
            any_number = any_number || std::holds_alternative<double>(value);
        }
    }
    return any_number;
}

std::vector<HeaderCell> BuildSpannerRow(const TableModel& model,
                                        const std::vector<const Column*>& visible,
                                        int level) {
    std::vector<HeaderCell> cells;
    std::optional<size_t> previous;

    for (const Column* column : visible) {
        std::optional<size_t> owner;
        const auto& spanners = model.Spanners();
        for (size_t i = 0; i < spanners.size() && !owner; ++i) {
            if (spanners[i].level != level) {
                continue;
            }
            for (const auto& id : spanners[i].column_ids) {
                if (model.DisplayColumn(id) == column->id) {
                    owner = i;
                    break;
                }
            }
        }

        if (owner.has_value() && owner == previous) {
            ++cells.back().span;
        } else {
            HeaderCell cell;
            if (owner.has_value()) {
                cell.text = spanners[*owner].label;
            }
            cells.push_back(std::move(cell));
        }
        previous = owner;
    }
    return cells;
}

}  // namespace

Grid Render(const TableModel& model) {
    Grid grid;
    const CellText cells = BuildCellText(model);
    const MarkIndex marks = BuildMarks(model);

    std::vector<const Column*> visible;
    for (const auto& column : model.Columns()) {
        if (model.IsVisible(column)) {
            visible.push_back(&column);
        }
    }

    grid.title = {model.Title(), marks.title};
    grid.subtitle = model.Subtitle();
    grid.stub_header = {model.StubHeader(), {}};
    grid.footnotes = marks.entries;

    // Spanner rows, highest level first, then column labels
    std::set<int, std::greater<int>> levels;
    for (const auto& spanner : model.Spanners()) {
        levels.insert(spanner.level);
    }
    for (int level : levels) {
        grid.header_rows.push_back(BuildSpannerRow(model, visible, level));
    }
    std::vector<HeaderCell> labels;
    for (const Column* column : visible) {
        labels.push_back({column->label, 1, MarksAt(marks.column_labels, column->id)});
    }
    grid.header_rows.push_back(std::move(labels));

    // Body: ungrouped rows, then each group behind its header row
    auto emit_row = [&](const Row& row) {
        GridRow line;
        line.kind = GridRowKind::kData;
        line.stub = {row.stub, MarksAt(marks.stubs, row.id)};
        line.indent = row.indent;
        line.row_id = row.id;
        for (const Column* column : visible) {
            line.cells.push_back({cells.text.at(column->id)[row.id],
                                  MarksAt(marks.cells, CellKey{row.id, column->id})});
        }
        grid.body.push_back(std::move(line));
    };

    for (const auto& row : model.Rows()) {
        if (!row.group.has_value()) {
            emit_row(row);
        }
    }
    for (const auto& group : model.RowGroups()) {
        bool header_emitted = false;
        for (const auto& row : model.Rows()) {
            if (!row.group.has_value() || *row.group != group) {
                continue;
            }
            if (!header_emitted) {
                GridRow header;
                header.kind = GridRowKind::kGroupHeader;
                header.stub = {group, {}};
                header.cells.assign(visible.size(), GridCell{});
                grid.body.push_back(std::move(header));
                header_emitted = true;
            }
            emit_row(row);
        }
    }

    // Layout
    grid.stub_width = DisplayWidth(grid.stub_header.text);
    for (const auto& line : grid.body) {
        const size_t indent = static_cast<size_t>(std::max(line.indent, 0)) * 2;
        grid.stub_width = std::max(grid.stub_width, indent + DisplayWidth(line.stub.text));
    }

    for (size_t i = 0; i < visible.size(); ++i) {
        const Column& column = *visible[i];
        ColumnLayout layout;
        layout.id = column.id;

        if (column.width.has_value()) {
            layout.width = static_cast<size_t>(*column.width);
        } else {
            layout.width = DisplayWidth(column.label);
            for (const auto& line : grid.body) {
                layout.width = std::max(layout.width, DisplayWidth(line.cells[i].text));
            }
        }

        layout.alignment = column.alignment;
        if (layout.alignment == Alignment::kAuto) {
            layout.alignment =
                IsNumericColumn(model, column) ? Alignment::kRight : Alignment::kLeft;
        }
        grid.columns.push_back(std::move(layout));
    }

    CLINTAB_LOG_DEBUG("Rendered grid: {} header rows, {} body rows, {} columns, {} footnotes",
                      grid.header_rows.size(), grid.body.size(), grid.columns.size(),
                      grid.footnotes.size());
    return grid;
}

}  // namespace clintab::table
