#include <spdlog/spdlog.h>
#include <pairdays/app/services/pair_analysis_service.h>
#include <pairdays/config/config_helpers.h>
#include <pairdays/engine/overlap_engine.h>
#include <pairdays/engine/record_validator.h>
#include <pairdays/engine/top_pair_selector.h>

namespace pairdays::app::services {

Result<ReportView> parseReportView(std::string_view name) {
    const std::string lower = config::to_lower(config::trimmed(std::string(name)));
    if (lower == "top")
        return ReportView::Top;
    if (lower == "all")
        return ReportView::All;
    return Error{ErrorCode::InvalidArgument,
                 "Unknown report view '" + std::string(name) + "' (expected top|all)"};
}

const char* reportViewName(ReportView view) {
    return view == ReportView::All ? "all" : "top";
}

Result<PairReport> PairAnalysisService::analyze(const AnalysisRequest& request) const {
    engine::RecordValidator validator{engine::DateNormalizer{request.today}};

    auto batch = validator.validateBatch(request.rows);
    if (!batch) {
        return batch.error();
    }

    const auto& assignments = batch.value().assignments;
    auto overlaps = engine::OverlapEngine::compute(assignments);

    PairReport report;
    report.assignmentCount = assignments.size();
    report.skippedRows = batch.value().skippedRows;

    report.perProject.reserve(overlaps.perProject.size());
    for (const auto& [key, overlap] : overlaps.perProject) {
        report.perProject.push_back(overlap);
    }
    report.totals.reserve(overlaps.totals.size());
    for (const auto& [pair, total] : overlaps.totals) {
        report.totals.push_back(total);
    }

    report.winners = engine::TopPairSelector::winners(overlaps.totals);
    report.topPairs = engine::TopPairSelector::select(overlaps.totals, overlaps.perProject);

    spdlog::info("Analyzed {} assignments: {} pair(s), {} winning", report.assignmentCount,
                 report.totals.size(), report.winners.size());
    return report;
}

} // namespace pairdays::app::services
