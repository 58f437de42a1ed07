#include <string>
#include <pairdays/cli/report_renderer.h>
#include <pairdays/cli/ui_helpers.hpp>

namespace pairdays::cli {

using app::services::PairReport;
using app::services::ReportView;

void ReportRenderer::renderText(std::ostream& os, const PairReport& report, ReportView view) {
    const auto& rows = report.rowsFor(view);
    if (rows.empty()) {
        os << kNoPairsMessage << '\n';
        return;
    }

    os << "Pairs Found: " << ui::colorize(std::to_string(rows.size()), ui::Ansi::BOLD) << '\n';

    ui::Table table;
    table.headers = {"Employee ID #1", "Employee ID #2", "Project ID", "Days worked"};
    table.align = {ui::Align::Right, ui::Align::Right, ui::Align::Right, ui::Align::Right};
    for (const auto& row : rows) {
        table.add_row({std::to_string(row.employeeLow), std::to_string(row.employeeHigh),
                       std::to_string(row.projectId), std::to_string(row.totalDaysWorked)});
    }
    ui::render_table(os, table);
}

json ReportRenderer::toJson(const PairReport& report, ReportView view) {
    const auto& rows = report.rowsFor(view);

    json pairs = json::array();
    for (const auto& row : rows) {
        pairs.push_back({{"emp1", row.employeeLow},
                         {"emp2", row.employeeHigh},
                         {"projectId", row.projectId},
                         {"totalDaysWorked", row.totalDaysWorked}});
    }

    json winners = json::array();
    for (const auto& total : report.winners) {
        winners.push_back({{"emp1", total.employeeLow},
                           {"emp2", total.employeeHigh},
                           {"totalDaysWorked", total.totalDaysWorked}});
    }

    json out;
    out["view"] = app::services::reportViewName(view);
    out["count"] = rows.size();
    out["assignments"] = report.assignmentCount;
    out["skippedRows"] = report.skippedRows;
    out["pairs"] = std::move(pairs);
    out["winners"] = std::move(winners);
    return out;
}

json ReportRenderer::errorToJson(const Error& error) {
    return json{{"error", {{"code", errorCodeName(error.code)}, {"message", error.message}}}};
}

} // namespace pairdays::cli
