/// @file table_model_test.cpp
/// @brief Tests for table model transformations and selectors

#include <gtest/gtest.h>

#include "common/error.h"
#include "table/table_model.h"

namespace clintab::table {
namespace {

class TableModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame_ = DataFrame({"stub", "grp", "n_A", "pct_A", "n_B", "pct_B", "note"});
        ASSERT_TRUE(frame_.AppendRow({std::string("F"), std::string("Sex"), 2.0, 0.5, 3.0, 0.75,
                                      std::string("x")}).ok());
        ASSERT_TRUE(frame_.AppendRow({std::string("M"), std::string("Sex"), 2.0, 0.5, 1.0, 0.25,
                                      std::monostate{}}).ok());
        ASSERT_TRUE(frame_.AppendRow({std::string("n"), std::string("Age"), 4.0, std::monostate{},
                                      4.0, std::monostate{}, std::monostate{}}).ok());

        auto model = TableModel::Bind(frame_, "stub", "grp");
        ASSERT_TRUE(model.ok()) << model.status().message();
        model_ = *std::move(model);
    }

    std::vector<std::string> ColumnIds() const {
        std::vector<std::string> ids;
        for (const auto& column : model_.Columns()) {
            ids.push_back(column.id);
        }
        return ids;
    }

    DataFrame frame_;
    TableModel model_;
};

TEST_F(TableModelTest, BindCreatesRowsAndColumns) {
    EXPECT_EQ(ColumnIds(),
              (std::vector<std::string>{"n_A", "pct_A", "n_B", "pct_B", "note"}));
    ASSERT_EQ(model_.Rows().size(), 3);
    EXPECT_EQ(model_.Rows()[0].stub, "F");
    EXPECT_EQ(model_.Rows()[2].id, 2);
    EXPECT_EQ(*model_.Rows()[2].group, "Age");
    EXPECT_EQ(model_.RowGroups(), (std::vector<std::string>{"Sex", "Age"}));
    EXPECT_EQ(model_.FindColumn("n_A")->label, "n_A");
    EXPECT_DOUBLE_EQ(std::get<double>(model_.CellValue(1, "n_B")), 1.0);
}

TEST_F(TableModelTest, BindWithoutGroupColumn) {
    auto model = TableModel::Bind(frame_, "stub");
    ASSERT_TRUE(model.ok());
    EXPECT_TRUE(model->RowGroups().empty());
    EXPECT_NE(model->FindColumn("grp"), nullptr);
}

TEST_F(TableModelTest, BindUnknownColumns) {
    auto no_stub = TableModel::Bind(frame_, "label");
    ASSERT_FALSE(no_stub.ok());
    EXPECT_EQ(GetErrorCode(no_stub.status()), ErrorCode::kUnknownReference);

    auto no_group = TableModel::Bind(frame_, "stub", "arm");
    EXPECT_EQ(GetErrorCode(no_group.status()), ErrorCode::kUnknownReference);
}

TEST_F(TableModelTest, BindRejectsDuplicateColumnIds) {
    DataFrame frame({"stub", "n_A", "n_A"});
    ASSERT_TRUE(frame.AppendRow({std::string("F"), 1.0, 2.0}).ok());

    auto model = TableModel::Bind(frame, "stub");
    ASSERT_FALSE(model.ok());
    EXPECT_EQ(model.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(TableModelTest, ColumnSelectors) {
    auto prefix = ColumnSelector::Prefix("n_").Resolve(model_);
    ASSERT_TRUE(prefix.ok());
    EXPECT_EQ(*prefix, (std::vector<std::string>{"n_A", "n_B"}));

    auto suffix = ColumnSelector::Suffix("_B").Resolve(model_);
    EXPECT_EQ(*suffix, (std::vector<std::string>{"n_B", "pct_B"}));

    auto where = ColumnSelector::Where([](const Column& column) {
        return column.id.size() == 4;
    }).Resolve(model_);
    EXPECT_EQ(*where, (std::vector<std::string>{"note"}));

    auto unknown = ColumnSelector::Ids({"n_A", "n_C"}).Resolve(model_);
    EXPECT_EQ(GetErrorCode(unknown.status()), ErrorCode::kUnknownReference);
}

TEST_F(TableModelTest, RowFilters) {
    auto in_group = RowFilter::InGroup("Sex").Resolve(model_);
    ASSERT_TRUE(in_group.ok());
    EXPECT_EQ(*in_group, (std::vector<bool>{true, true, false}));

    auto stub = RowFilter::StubEquals("M").Resolve(model_);
    EXPECT_EQ(*stub, (std::vector<bool>{false, true, false}));

    auto not_missing = RowFilter::NotMissing("pct_A").Resolve(model_);
    EXPECT_EQ(*not_missing, (std::vector<bool>{true, true, false}));

    auto ids = RowFilter::Ids({2}).Resolve(model_);
    EXPECT_EQ(*ids, (std::vector<bool>{false, false, true}));

    EXPECT_EQ(GetErrorCode(RowFilter::Ids({3}).Resolve(model_).status()),
              ErrorCode::kUnknownReference);
    EXPECT_EQ(GetErrorCode(RowFilter::NotMissing("pct_C").Resolve(model_).status()),
              ErrorCode::kUnknownReference);
}

TEST_F(TableModelTest, ApplyFormatResolvesOnce) {
    ASSERT_TRUE(model_.ApplyFormat(ColumnSelector::Prefix("pct_"), RowFilter::All(),
                                   FormatRule::Percent(1)).ok());
    ASSERT_EQ(model_.FormatRules().size(), 1);
    EXPECT_EQ(model_.FormatRules()[0].column_ids,
              (std::vector<std::string>{"pct_A", "pct_B"}));
    EXPECT_EQ(model_.FormatRules()[0].rows, (std::vector<bool>{true, true, true}));
}

TEST_F(TableModelTest, ApplyFormatUnknownColumnLeavesModelUnchanged) {
    auto status = model_.ApplyFormat(ColumnSelector::Ids({"mean_A"}), RowFilter::All(),
                                     FormatRule::Fixed(1));
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kUnknownReference);
    EXPECT_TRUE(model_.FormatRules().empty());
}

TEST_F(TableModelTest, MergeHidesSecondarySources) {
    ASSERT_TRUE(model_.MergeColumns({"n_A", "pct_A"}, "{1} ({2})").ok());

    EXPECT_TRUE(model_.IsVisible(*model_.FindColumn("n_A")));
    EXPECT_FALSE(model_.IsVisible(*model_.FindColumn("pct_A")));
    EXPECT_EQ(model_.FindColumn("pct_A")->merged_into, "n_A");
    EXPECT_EQ(model_.DisplayColumn("pct_A"), "n_A");
    ASSERT_EQ(model_.MergeRules().size(), 1);
    EXPECT_EQ(model_.MergeRules()[0].pattern, "{1} ({2})");
}

TEST_F(TableModelTest, MergeSourceCountOutOfRange) {
    auto one = model_.MergeColumns({"n_A"}, "{1}");
    EXPECT_EQ(GetErrorCode(one), ErrorCode::kInvalidMergePattern);

    auto five = model_.MergeColumns({"n_A", "pct_A", "n_B", "pct_B", "note"},
                                    "{1}{2}{3}{4}{5}");
    EXPECT_EQ(GetErrorCode(five), ErrorCode::kInvalidMergePattern);
    EXPECT_TRUE(model_.MergeRules().empty());
}

TEST_F(TableModelTest, MergePatternMismatch) {
    auto status = model_.MergeColumns({"n_A", "pct_A"}, "{1}");
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kInvalidMergePattern);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_TRUE(model_.FindColumn("pct_A")->merged_into.empty());
}

TEST_F(TableModelTest, MergeUnknownColumn) {
    auto status = model_.MergeColumns({"n_A", "sd_A"}, "{1} ({2})");
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kUnknownReference);
}

TEST_F(TableModelTest, MergeAlreadyMergedColumn) {
    ASSERT_TRUE(model_.MergeColumns({"n_A", "pct_A"}, "{1} ({2})").ok());

    auto status = model_.MergeColumns({"n_B", "pct_A"}, "{1}/{2}");
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kColumnAlreadyMerged);
    EXPECT_EQ(model_.MergeRules().size(), 1);
}

TEST_F(TableModelTest, MergedSlotCanFeedALaterMerge) {
    ASSERT_TRUE(model_.MergeColumns({"n_A", "pct_A"}, "{1} ({2})").ok());
    ASSERT_TRUE(model_.MergeColumns({"n_B", "n_A"}, "{1} vs {2}").ok());

    EXPECT_EQ(model_.FindColumn("n_A")->merged_into, "n_B");
    EXPECT_EQ(model_.DisplayColumn("pct_A"), "n_B");
}

TEST_F(TableModelTest, HiddenColumnsCanStillBeMerged) {
    ASSERT_TRUE(model_.HideColumns({"pct_B"}).ok());
    EXPECT_TRUE(model_.MergeColumns({"n_B", "pct_B"}, "{1} ({2})").ok());
}

TEST_F(TableModelTest, CoalesceInsertsSyntheticColumn) {
    ASSERT_TRUE(model_.CoalesceColumns({"n_B", "pct_B"}, "stat_B", "B").ok());

    EXPECT_EQ(ColumnIds(),
              (std::vector<std::string>{"n_A", "pct_A", "stat_B", "n_B", "pct_B", "note"}));
    const Column* output = model_.FindColumn("stat_B");
    ASSERT_NE(output, nullptr);
    EXPECT_TRUE(output->synthetic);
    EXPECT_EQ(output->label, "B");
    EXPECT_EQ(output->alignment, Alignment::kCenter);
    EXPECT_EQ(model_.FindColumn("n_B")->merged_into, "stat_B");
    EXPECT_TRUE(IsMissing(model_.CellValue(0, "stat_B")));
}

TEST_F(TableModelTest, CoalesceRejectsTakenOutputAndMergedSources) {
    EXPECT_FALSE(model_.CoalesceColumns({"n_B", "pct_B"}, "n_A", "B").ok());

    ASSERT_TRUE(model_.MergeColumns({"n_A", "pct_A"}, "{1} ({2})").ok());
    auto status = model_.CoalesceColumns({"pct_A", "n_B"}, "stat", "S");
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kColumnAlreadyMerged);
    EXPECT_EQ(model_.FindColumn("stat"), nullptr);
}

TEST_F(TableModelTest, SpannerConflictAtSameLevel) {
    ASSERT_TRUE(model_.AddSpanner("Group A", {"n_A", "pct_A"}).ok());

    auto conflict = model_.AddSpanner("Counts", {"n_A", "n_B"});
    EXPECT_EQ(GetErrorCode(conflict), ErrorCode::kSpannerConflict);
    EXPECT_EQ(conflict.code(), absl::StatusCode::kAlreadyExists);

    EXPECT_TRUE(model_.AddSpanner("All groups", {"n_A", "pct_A", "n_B"}, 1).ok());
    EXPECT_EQ(model_.Spanners().size(), 2);
}

TEST_F(TableModelTest, SpannerUnknownColumn) {
    auto status = model_.AddSpanner("Group C", {"n_C"});
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kUnknownReference);
}

TEST_F(TableModelTest, AddRowGroupMovesRows) {
    ASSERT_TRUE(model_.AddRowGroup("Other", {0}).ok());
    EXPECT_EQ(*model_.Rows()[0].group, "Other");
    EXPECT_EQ(model_.RowGroups().back(), "Other");

    EXPECT_EQ(GetErrorCode(model_.AddRowGroup("Other", {7})), ErrorCode::kUnknownReference);
}

TEST_F(TableModelTest, StructuralEdits) {
    ASSERT_TRUE(model_.SetWidth("n_A", 12).ok());
    ASSERT_TRUE(model_.SetAlignment("note", Alignment::kLeft).ok());
    ASSERT_TRUE(model_.IndentRows({0, 1}, 2).ok());

    EXPECT_EQ(*model_.FindColumn("n_A")->width, 12);
    EXPECT_EQ(model_.FindColumn("note")->alignment, Alignment::kLeft);
    EXPECT_EQ(model_.Rows()[1].indent, 2);
    EXPECT_EQ(model_.Rows()[2].indent, 0);

    EXPECT_EQ(GetErrorCode(model_.SetWidth("n_C", 5)), ErrorCode::kUnknownReference);
    EXPECT_FALSE(model_.SetWidth("n_A", 0).ok());
    EXPECT_EQ(GetErrorCode(model_.SetAlignment("n_C", Alignment::kLeft)),
              ErrorCode::kUnknownReference);
    EXPECT_EQ(GetErrorCode(model_.IndentRows({5}, 1)), ErrorCode::kUnknownReference);
}

TEST_F(TableModelTest, RelabelIsAllOrNothing) {
    auto status = model_.RelabelColumns({{"n_A", "Placebo"}, {"n_Z", "Other"}});
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kUnknownReference);
    EXPECT_EQ(model_.FindColumn("n_A")->label, "n_A");

    ASSERT_TRUE(model_.RelabelColumns({{"n_A", "Placebo"}, {"n_B", "Active"}}).ok());
    EXPECT_EQ(model_.FindColumn("n_B")->label, "Active");
}

TEST_F(TableModelTest, FootnoteLocationsAreChecked) {
    EXPECT_TRUE(model_.AddFootnote(FootnoteLocation::Title(), "t").ok());
    EXPECT_TRUE(model_.AddFootnote(FootnoteLocation::Cell(1, "n_B"), "c").ok());

    EXPECT_EQ(GetErrorCode(model_.AddFootnote(FootnoteLocation::ColumnLabel("n_C"), "x")),
              ErrorCode::kUnknownReference);
    EXPECT_EQ(GetErrorCode(model_.AddFootnote(FootnoteLocation::Stub(9), "x")),
              ErrorCode::kUnknownReference);
    EXPECT_EQ(model_.Footnotes().size(), 2);
}

TEST_F(TableModelTest, CopyIsASnapshot) {
    TableModel snapshot = model_;
    ASSERT_TRUE(model_.MergeColumns({"n_A", "pct_A"}, "{1} ({2})").ok());
    ASSERT_TRUE(model_.RelabelColumns({{"n_A", "Placebo"}}).ok());

    EXPECT_TRUE(snapshot.MergeRules().empty());
    EXPECT_TRUE(snapshot.FindColumn("pct_A")->merged_into.empty());
    EXPECT_EQ(snapshot.FindColumn("n_A")->label, "n_A");
}

}  // namespace
}  // namespace clintab::table
