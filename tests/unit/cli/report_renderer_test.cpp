#include <gtest/gtest.h>
#include <sstream>
#include <pairdays/cli/report_renderer.h>
#include <pairdays/cli/ui_helpers.hpp>

using namespace pairdays;
using namespace pairdays::cli;
using namespace pairdays::app::services;
using pairdays::engine::EmployeePairTotal;
using pairdays::engine::ProjectPairOverlap;

namespace {

class ReportRendererTest : public ::testing::Test {
protected:
    void SetUp() override { ui::set_color_mode(ui::ColorMode::ForceOff); }
    void TearDown() override { ui::set_color_mode(ui::ColorMode::Auto); }

    static PairReport sampleReport() {
        PairReport report;
        report.assignmentCount = 4;
        report.perProject = {ProjectPairOverlap{1, 2, 1, 6}, ProjectPairOverlap{1, 3, 2, 3}};
        report.totals = {EmployeePairTotal{1, 2, 6}, EmployeePairTotal{1, 3, 3}};
        report.winners = {EmployeePairTotal{1, 2, 6}};
        report.topPairs = {ProjectPairOverlap{1, 2, 1, 6}};
        return report;
    }
};

} // namespace

TEST_F(ReportRendererTest, TextTopView) {
    std::ostringstream os;
    ReportRenderer::renderText(os, sampleReport(), ReportView::Top);
    EXPECT_EQ(os.str(), "Pairs Found: 1\n"
                        "  Employee ID #1  Employee ID #2  Project ID  Days worked\n"
                        "  --------------  --------------  ----------  -----------\n"
                        "               1               2           1            6\n");
}

TEST_F(ReportRendererTest, TextAllView) {
    std::ostringstream os;
    ReportRenderer::renderText(os, sampleReport(), ReportView::All);
    const std::string text = os.str();
    EXPECT_EQ(text.rfind("Pairs Found: 2\n", 0), 0u);
    EXPECT_NE(text.find("               1               3           2            3\n"),
              std::string::npos);
}

TEST_F(ReportRendererTest, EmptyViewPrintsNoPairsMessage) {
    std::ostringstream os;
    ReportRenderer::renderText(os, PairReport{}, ReportView::Top);
    EXPECT_EQ(os.str(), "None Pairs Found!\n");
}

TEST_F(ReportRendererTest, JsonCarriesRowsAndWinners) {
    auto j = ReportRenderer::toJson(sampleReport(), ReportView::All);
    EXPECT_EQ(j["view"], "all");
    EXPECT_EQ(j["count"], 2);
    EXPECT_EQ(j["assignments"], 4);
    EXPECT_EQ(j["skippedRows"], 0);
    ASSERT_EQ(j["pairs"].size(), 2u);
    EXPECT_EQ(j["pairs"][1]["emp1"], 1);
    EXPECT_EQ(j["pairs"][1]["emp2"], 3);
    EXPECT_EQ(j["pairs"][1]["projectId"], 2);
    EXPECT_EQ(j["pairs"][1]["totalDaysWorked"], 3);
    ASSERT_EQ(j["winners"].size(), 1u);
    EXPECT_EQ(j["winners"][0]["totalDaysWorked"], 6);
}

TEST_F(ReportRendererTest, JsonForEmptyReport) {
    auto j = ReportRenderer::toJson(PairReport{}, ReportView::Top);
    EXPECT_EQ(j["count"], 0);
    EXPECT_TRUE(j["pairs"].is_array());
    EXPECT_TRUE(j["pairs"].empty());
}

TEST_F(ReportRendererTest, ErrorJson) {
    auto j = ReportRenderer::errorToJson(Error{ErrorCode::InvalidFormat, "bad row"});
    EXPECT_EQ(j["error"]["code"], "InvalidFormat");
    EXPECT_EQ(j["error"]["message"], "bad row");
}
