#pragma once

/// @file table_model.h
/// @brief Mutable-by-transformation table structure
///
/// A TableModel holds bound data plus an ordered record of transformations
/// (format rules, merges, coalesces, spanners, row groups, footnotes). Every
/// transformation validates its arguments completely before touching the
/// model, so a failed call leaves the model unchanged. Copying a model takes
/// a snapshot.

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/data_frame.h"
#include "table/format.h"
#include "table/selectors.h"
#include "table/table_types.h"

namespace clintab::table {

/// @brief Format rule resolved against the model
struct FormatAssignment {
    std::vector<std::string> column_ids;
    std::vector<bool> rows;  ///< Indexed by row id
    FormatRule rule;
};

/// @brief Merge of 2-4 columns into the first one through a pattern
struct MergeRule {
    std::vector<std::string> source_ids;
    std::string pattern;
    std::vector<bool> rows;  ///< Indexed by row id
};

/// @brief Synthetic column showing the first non-missing source per row
struct CoalesceRule {
    std::vector<std::string> source_ids;
    std::string output_id;
};

inline constexpr std::string_view kDefaultMissingText = "-";

class TableModel {
public:
    TableModel() = default;

    /// @brief Build a model from a data frame
    ///
    /// Each frame row becomes a body row whose id is its position. The stub
    /// column supplies row stubs, the group column (if non-empty) row groups
    /// in first-appearance order; all other columns become data columns
    /// labeled with their names.
    static absl::StatusOr<TableModel> Bind(const DataFrame& frame,
                                           std::string_view stub_column,
                                           std::string_view group_column = "");

    // =========================================================================
    // Transformations
    // =========================================================================

    /// @brief Attach a number format to the selected cells
    ///
    /// Later rules override earlier ones for the same cell.
    absl::Status ApplyFormat(const ColumnSelector& columns, const RowFilter& rows,
                             const FormatRule& rule);

    /// @brief Combine 2-4 columns into the first one using a {k} pattern
    absl::Status MergeColumns(const std::vector<std::string>& source_ids,
                              std::string_view pattern,
                              const RowFilter& rows = RowFilter::All());

    /// @brief Add a column showing the first source with a value in each row
    absl::Status CoalesceColumns(const std::vector<std::string>& source_ids,
                                 std::string_view output_id,
                                 std::string_view label);

    absl::Status AddSpanner(std::string_view label,
                            const std::vector<std::string>& column_ids, int level = 0);

    /// @brief Move rows into a row group, declaring it if new
    absl::Status AddRowGroup(std::string_view label, const std::vector<size_t>& row_ids);

    absl::Status SetWidth(std::string_view column_id, int width);
    absl::Status SetAlignment(std::string_view column_id, Alignment alignment);
    absl::Status RelabelColumns(const std::map<std::string, std::string>& labels);
    absl::Status IndentRows(const std::vector<size_t>& row_ids, int level);
    absl::Status HideColumns(const std::vector<std::string>& column_ids);
    absl::Status AddFootnote(const FootnoteLocation& location, std::string_view text);

    void SetTitle(std::string title, std::string subtitle = "");
    void SetStubHeader(std::string label) { stub_header_ = std::move(label); }
    void SetMissingText(std::string text) { missing_text_ = std::move(text); }
    void SetMarkStyle(MarkStyle style) { mark_style_ = style; }

    // =========================================================================
    // Accessors
    // =========================================================================

    const std::vector<Column>& Columns() const { return columns_; }
    const std::vector<Row>& Rows() const { return rows_; }
    const std::vector<std::string>& RowGroups() const { return row_groups_; }
    const std::vector<Spanner>& Spanners() const { return spanners_; }
    const std::vector<FormatAssignment>& FormatRules() const { return format_rules_; }
    const std::vector<MergeRule>& MergeRules() const { return merge_rules_; }
    const std::vector<CoalesceRule>& CoalesceRules() const { return coalesce_rules_; }
    const std::vector<Footnote>& Footnotes() const { return footnotes_; }

    const std::string& Title() const { return title_; }
    const std::string& Subtitle() const { return subtitle_; }
    const std::string& StubHeader() const { return stub_header_; }
    const std::string& MissingText() const { return missing_text_; }
    MarkStyle GetMarkStyle() const { return mark_style_; }

    /// @brief Column by id, nullptr if absent
    const Column* FindColumn(std::string_view id) const;

    /// @brief Underlying value of a cell; missing for synthetic columns
    const Value& CellValue(size_t row_id, std::string_view column_id) const;

    /// @brief Whether a column is drawn: not hidden and not absorbed
    bool IsVisible(const Column& column) const {
        return !column.hidden && column.merged_into.empty();
    }

    /// @brief Follow merged_into links to the column that displays id
    std::string DisplayColumn(std::string_view id) const;

private:
    Column* MutableColumn(std::string_view id);
    absl::Status CheckColumnsExist(const std::vector<std::string>& ids) const;
    absl::Status CheckRowsExist(const std::vector<size_t>& ids) const;
    absl::Status Reject(absl::Status status, std::string_view operation) const;

    DataFrame data_;
    std::vector<Column> columns_;
    std::vector<Row> rows_;
    std::vector<std::string> row_groups_;
    std::vector<Spanner> spanners_;
    std::vector<FormatAssignment> format_rules_;
    std::vector<MergeRule> merge_rules_;
    std::vector<CoalesceRule> coalesce_rules_;
    std::vector<Footnote> footnotes_;

    std::string title_;
    std::string subtitle_;
    std::string stub_header_;
    std::string missing_text_{kDefaultMissingText};
    MarkStyle mark_style_ = MarkStyle::kNumeric;
};

}  // namespace clintab::table
