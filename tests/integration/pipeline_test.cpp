/// @file pipeline_test.cpp
/// @brief Integration tests for the records -> summary -> table -> grid pipeline

#include <gtest/gtest.h>

#include <vector>

#include "common/config.h"
#include "common/logging.h"
#include "report/report_options.h"
#include "report/standard_tables.h"
#include "stats/aggregator.h"
#include "stats/summary_frame.h"
#include "table/renderer.h"
#include "table/table_model.h"

namespace clintab {
namespace {

using stats::StatColumnId;
using table::ColumnSelector;
using table::FormatRule;
using table::RowFilter;
using table::TableModel;

// =============================================================================
// Fixtures
// =============================================================================

stats::SubjectRecord Subject(std::string arm, Value age, std::string response) {
    stats::SubjectRecord record;
    record.values["ARM"] = std::move(arm);
    record.values["AGE"] = std::move(age);
    record.values["RESP"] = std::move(response);
    return record;
}

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        InitLogging();

        records_ = {
            Subject("A", 30.0, "Y"),
            Subject("A", 40.0, "N"),
            Subject("B", 50.0, "Y"),
            Subject("B", 60.0, "Y"),
        };
    }

    std::vector<stats::SubjectRecord> records_;
};

// =============================================================================
// Tests
// =============================================================================

TEST_F(PipelineTest, AgeScenarioThroughGeneralMerges) {
    std::vector<stats::VariableSpec> variables = {{"AGE", "Age", stats::ContinuousType{}}};
    auto rows = stats::Aggregate(records_, "ARM", variables);
    ASSERT_TRUE(rows.ok()) << rows.status().message();

    const std::vector<std::string> groups = {"A", "B"};
    DataFrame frame = stats::SummaryFrame(*rows, groups);

    auto bound = TableModel::Bind(frame, stats::kLabelColumn, stats::kCategoryColumn);
    ASSERT_TRUE(bound.ok()) << bound.status().message();
    TableModel model = *std::move(bound);

    ASSERT_TRUE(model.HideColumns({"variable", "kind"}).ok());
    ASSERT_TRUE(model.ApplyFormat(ColumnSelector::Prefix("mean_"), RowFilter::All(),
                                  FormatRule::Fixed(0)).ok());
    ASSERT_TRUE(model.ApplyFormat(ColumnSelector::Prefix("sd_"), RowFilter::All(),
                                  FormatRule::Fixed(2)).ok());
    for (const auto& group : groups) {
        ASSERT_TRUE(model.MergeColumns({StatColumnId("mean", group), StatColumnId("sd", group)},
                                       "{1} ({2})").ok());
        ASSERT_TRUE(model.MergeColumns({StatColumnId("min", group), StatColumnId("max", group)},
                                       "{1} - {2}").ok());
    }
    model.SetMissingText("");

    table::Grid grid = table::Render(model);
    auto body = grid.BodyText();
    ASSERT_EQ(body.size(), 4);

    // Visible columns per group: n, mean, median, min
    EXPECT_EQ(body[0][0], "2");
    EXPECT_EQ(body[0][4], "2");
    EXPECT_EQ(body[1][1], "35 (7.07)");
    EXPECT_EQ(body[1][5], "55 (7.07)");
    EXPECT_EQ(body[2][2], "35");
    EXPECT_EQ(body[2][6], "55");
    EXPECT_EQ(body[3][3], "30 - 40");
    EXPECT_EQ(body[3][7], "50 - 60");
}

TEST_F(PipelineTest, ConfiguredDemographicTable) {
    auto config = Config::LoadFromString(R"(
logging:
  level: warn
table:
  missing_text: "NE"
  footnote_marks: letters
format:
  mean_decimals: 1
  sd_decimals: 1
)");
    ASSERT_TRUE(config.ok());

    auto log_config = LogConfigFromSettings(*config);
    ASSERT_TRUE(log_config.ok()) << log_config.status().message();
    SetLogLevel(log_config->level);

    auto options = report::LoadReportOptions(*config);
    ASSERT_TRUE(options.ok()) << options.status().message();

    std::vector<stats::VariableSpec> variables = {
        {"RESP", "Responder", stats::CategoricalType{{"Y", "N"}}},
        {"AGE", "Age", stats::ContinuousType{"years"}},
    };
    auto rows = stats::Aggregate(records_, "ARM", variables);
    ASSERT_TRUE(rows.ok());

    auto model = report::BuildDemographicTable(*rows, {"A", "B"}, *options);
    ASSERT_TRUE(model.ok()) << model.status().message();
    model->SetTitle("Table 14.1.1", "Demographics");
    ASSERT_TRUE(model->AddFootnote(table::FootnoteLocation::Title(), "Safety population.").ok());
    ASSERT_TRUE(model->AddFootnote(table::FootnoteLocation::ColumnLabel("stat_B"),
                                   "Open-label arm.").ok());

    table::Grid grid = table::Render(*model);
    EXPECT_EQ(grid.title.text, "Table 14.1.1");
    EXPECT_EQ(grid.title.marks, (std::vector<std::string>{"a"}));
    EXPECT_EQ(grid.header_rows.back()[1].text, "B (N=2)");
    EXPECT_EQ(grid.header_rows.back()[1].marks, (std::vector<std::string>{"b"}));

    auto body = grid.BodyText();
    ASSERT_EQ(body.size(), 6);
    EXPECT_EQ(body[0], (std::vector<std::string>{"1 (50.0%)", "2 (100.0%)"}));
    EXPECT_EQ(body[1], (std::vector<std::string>{"1 (50.0%)", "0 (0.0%)"}));
    EXPECT_EQ(body[3], (std::vector<std::string>{"35.0 (7.1)", "55.0 (7.1)"}));
    EXPECT_EQ(body[5], (std::vector<std::string>{"30 - 40", "50 - 60"}));

    const nlohmann::json json = grid.ToJson();
    EXPECT_EQ(json["footnotes"].size(), 2);
    EXPECT_EQ(json["footnotes"][1]["mark"], "b");
    EXPECT_EQ(json, table::Render(*model).ToJson());
}

TEST_F(PipelineTest, ResponseTableEndToEnd) {
    std::vector<stats::SubjectRecord> records;
    for (int i = 0; i < 10; ++i) {
        records.push_back(Subject("Placebo", 40.0, i < 3 ? "Y" : "N"));
        records.push_back(Subject("Active", 40.0, i < 7 ? "Y" : "N"));
    }

    stats::ResponseOptions response;
    response.group_var = "ARM";
    response.response_var = "RESP";
    response.treatment_group = "Active";
    response.reference_group = "Placebo";

    auto rows = stats::SummarizeResponse(records, response);
    ASSERT_TRUE(rows.ok()) << rows.status().message();

    const auto& odds = rows->front().odds_ratio;
    ASSERT_TRUE(odds.odds_ratio && odds.lower && odds.upper);
    EXPECT_NEAR(*odds.odds_ratio, (7.0 / 3.0) / (3.0 / 7.0), 1e-12);
    EXPECT_LT(*odds.lower, *odds.odds_ratio);
    EXPECT_LT(*odds.odds_ratio, *odds.upper);

    report::ReportOptions options;
    auto model = report::BuildResponseTable(*rows, {"Placebo", "Active"}, "Active",
                                            "Placebo", options);
    ASSERT_TRUE(model.ok()) << model.status().message();

    table::Grid grid = table::Render(*model);
    ASSERT_EQ(grid.BodyText().size(), 1);
    EXPECT_EQ(grid.BodyText()[0][0], "3/10 (30.0%)");
    EXPECT_EQ(grid.BodyText()[0][2], "7/10 (70.0%)");
    EXPECT_EQ(grid, table::Render(*model));
}

}  // namespace
}  // namespace clintab
