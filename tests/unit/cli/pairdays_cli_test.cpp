#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>
#include <pairdays/cli/pairdays_cli.h>
#include <pairdays/cli/ui_helpers.hpp>

#include "../../support/temp_dir_scope.hpp"

using pairdays::cli::PairdaysCLI;
using pairdays::test_support::TempDirScope;

namespace {

struct RunOutput {
    int code = 0;
    std::string out;
    std::string err;
};

class PairdaysCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        scope_ = std::make_unique<TempDirScope>(TempDirScope::unique_under("pairdays_cli_test"));
        configPath_ = (scope_->path() / "no-config.toml").string();
    }

    void TearDown() override {
        pairdays::cli::ui::set_color_mode(pairdays::cli::ui::ColorMode::Auto);
        scope_.reset();
    }

    // Runs with --no-color and a config path that does not exist
    RunOutput run(std::vector<std::string> args) {
        args.insert(args.begin(), {"pairdays", "--no-color", "--config", configPath_});
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(a.data());

        std::ostringstream out;
        std::ostringstream err;
        PairdaysCLI cli(out, err);
        RunOutput result;
        result.code = cli.run(static_cast<int>(argv.size()), argv.data());
        result.out = out.str();
        result.err = err.str();
        return result;
    }

    std::string writeInput(const std::string& content) {
        return scope_->write("input.csv", content).string();
    }

    std::unique_ptr<TempDirScope> scope_;
    std::string configPath_;
};

const char* kSampleInput = "EmpID, ProjectID, DateFrom, DateTo\n"
                           "1, 1, 2024-01-01, 2024-01-10\n"
                           "2, 1, 2024-01-05, 2024-01-15\n"
                           "1, 2, 2024-02-01, 2024-02-05\n"
                           "3, 2, 2024-02-03, 2024-02-10\n";

} // namespace

TEST_F(PairdaysCliTest, AnalyzePrintsTopPairTable) {
    auto input = writeInput(kSampleInput);
    auto r = run({"analyze", "--skip-header", input});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_EQ(r.out.rfind("Pairs Found: 1\n", 0), 0u) << r.out;
    EXPECT_NE(r.out.find("Days worked"), std::string::npos);
    EXPECT_TRUE(r.err.empty()) << r.err;
}

TEST_F(PairdaysCliTest, AnalyzeAllViewAsJson) {
    auto input = writeInput(kSampleInput);
    auto r = run({"--json", "analyze", "--skip-header", "--view", "all", input});
    ASSERT_EQ(r.code, 0) << r.err;
    auto j = nlohmann::json::parse(r.out);
    EXPECT_EQ(j["view"], "all");
    EXPECT_EQ(j["count"], 2);
    EXPECT_EQ(j["winners"][0]["emp1"], 1);
    EXPECT_EQ(j["winners"][0]["emp2"], 2);
    EXPECT_EQ(j["winners"][0]["totalDaysWorked"], 6);
}

TEST_F(PairdaysCliTest, HeaderRowWithoutSkipFailsWithHint) {
    auto input = writeInput(kSampleInput);
    auto r = run({"analyze", input});
    EXPECT_EQ(r.code, 1);
    EXPECT_TRUE(r.out.empty()) << r.out;
    EXPECT_NE(r.err.find("[FAIL] Invalid data format in row 1"), std::string::npos) << r.err;
    EXPECT_NE(r.err.find("Try: pairdays analyze --skip-header <file>"), std::string::npos);
}

TEST_F(PairdaysCliTest, NoOverlapPrintsNoneFound) {
    auto input = writeInput("1,1,2024-01-01,2024-01-10\n2,2,2024-01-01,2024-01-10\n");
    auto r = run({"analyze", input});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_EQ(r.out, "None Pairs Found!\n");
}

TEST_F(PairdaysCliTest, TodayFlagFixesNullDates) {
    auto input = writeInput("1;9;2024-03-01;NULL\n2;9;2024-03-08;\n");
    auto r = run({"--json", "analyze", "-d", ";", "--today", "2024-03-10", input});
    ASSERT_EQ(r.code, 0) << r.err;
    auto j = nlohmann::json::parse(r.out);
    ASSERT_EQ(j["pairs"].size(), 1u);
    EXPECT_EQ(j["pairs"][0]["totalDaysWorked"], 3);
}

TEST_F(PairdaysCliTest, BadTodayValueIsRejected) {
    auto input = writeInput(kSampleInput);
    auto r = run({"analyze", "--today", "someday", input});
    EXPECT_EQ(r.code, 1);
    EXPECT_NE(r.err.find("Invalid --today value"), std::string::npos) << r.err;
}

TEST_F(PairdaysCliTest, BadDelimiterIsRejected) {
    auto input = writeInput(kSampleInput);
    auto r = run({"analyze", "-d", "::", input});
    EXPECT_EQ(r.code, 1);
    EXPECT_NE(r.err.find("Delimiter must be a single character"), std::string::npos) << r.err;
}

TEST_F(PairdaysCliTest, MissingFileReportsJsonError) {
    auto r = run({"--json", "analyze", (scope_->path() / "absent.csv").string()});
    EXPECT_EQ(r.code, 1);
    auto j = nlohmann::json::parse(r.out);
    EXPECT_EQ(j["error"]["code"], "FileNotFound");
}

TEST_F(PairdaysCliTest, ValidateReportsCounts) {
    auto input = writeInput("1,1,2024-01-01,2024-01-10\n1,2\n2,1,2024-01-05,NULL\n");
    auto r = run({"validate", input});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_EQ(r.out, "[OK] 2 assignment(s) valid, 1 short row(s) skipped\n");
}

TEST_F(PairdaysCliTest, ValidateJson) {
    auto input = writeInput(kSampleInput);
    auto r = run({"--json", "validate", "--skip-header", input});
    ASSERT_EQ(r.code, 0) << r.err;
    auto j = nlohmann::json::parse(r.out);
    EXPECT_EQ(j["valid"], true);
    EXPECT_EQ(j["rows"], 4);
    EXPECT_EQ(j["assignments"], 4);
}

TEST_F(PairdaysCliTest, ConfigFileSuppliesDefaults) {
    configPath_ = scope_->write("config.toml", "[input]\ndelimiter = \"|\"\nskip_header = true\n\n"
                                               "[report]\nview = \"all\"\n\n[output]\njson = true\n")
                      .string();
    auto input = writeInput("id|project|from|to\n1|1|2024-01-01|2024-01-10\n"
                            "2|1|2024-01-10|2024-01-20\n");
    auto r = run({"analyze", input});
    ASSERT_EQ(r.code, 0) << r.err;
    auto j = nlohmann::json::parse(r.out);
    EXPECT_EQ(j["view"], "all");
    EXPECT_EQ(j["pairs"][0]["totalDaysWorked"], 1);
}

TEST_F(PairdaysCliTest, InvalidConfigFailsBeforeRunning) {
    configPath_ = scope_->write("config.toml", "[report]\nview = \"sideways\"\n").string();
    auto input = writeInput(kSampleInput);
    auto r = run({"analyze", "--skip-header", input});
    EXPECT_EQ(r.code, 1);
    EXPECT_NE(r.err.find("report.view"), std::string::npos) << r.err;
}

TEST_F(PairdaysCliTest, ConfigCommandShowsDefaults) {
    auto r = run({"config"});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_NE(r.out.find("(defaults; no file at"), std::string::npos) << r.out;
    EXPECT_NE(r.out.find("view = \"top\""), std::string::npos);
}

TEST_F(PairdaysCliTest, SubcommandIsRequired) {
    auto r = run({});
    EXPECT_NE(r.code, 0);
}

TEST_F(PairdaysCliTest, UnknownViewIsAParseError) {
    auto input = writeInput(kSampleInput);
    auto r = run({"analyze", "--view", "best", input});
    EXPECT_NE(r.code, 0);
    EXPECT_TRUE(r.out.empty());
}
