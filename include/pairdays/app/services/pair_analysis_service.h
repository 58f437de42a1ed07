#pragma once

// Analysis service shared by the CLI commands: validation -> overlap scan ->
// top-pair selection, all-or-nothing.

#include <pairdays/core/types.h>
#include <pairdays/engine/date_normalizer.h>
#include <pairdays/engine/records.h>

#include <string_view>
#include <vector>

namespace pairdays::app::services {

// Which result set a presentation layer shows
enum class ReportView { Top, All };

Result<ReportView> parseReportView(std::string_view name);
const char* reportViewName(ReportView view);

struct AnalysisRequest {
    std::vector<Row> rows;
    // Date used for empty / "null" date fields; system clock when unset
    engine::TodayProvider today;
};

struct PairReport {
    size_t assignmentCount = 0;
    size_t skippedRows = 0;

    // Every (pair, project) overlap, key order
    std::vector<engine::ProjectPairOverlap> perProject;
    // Every pair total, pair order
    std::vector<engine::EmployeePairTotal> totals;
    // Pair totals tied at the maximum
    std::vector<engine::EmployeePairTotal> winners;
    // perProject filtered down to the winners
    std::vector<engine::ProjectPairOverlap> topPairs;

    const std::vector<engine::ProjectPairOverlap>& rowsFor(ReportView view) const {
        return view == ReportView::All ? perProject : topPairs;
    }
};

class PairAnalysisService {
public:
    Result<PairReport> analyze(const AnalysisRequest& request) const;
};

} // namespace pairdays::app::services
