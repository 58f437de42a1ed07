#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <pairdays/app/services/pair_analysis_service.h>
#include <pairdays/core/types.h>

namespace pairdays::cli {

using json = nlohmann::json;

/**
 * @brief Presentation of analysis results
 *
 * Text mode prints "Pairs Found: N" followed by a table of
 * Employee ID #1 / Employee ID #2 / Project ID / Days worked, or
 * "None Pairs Found!" when the selected view is empty. JSON mode emits the
 * same rows plus the winning pair totals.
 */
class ReportRenderer {
public:
    static constexpr const char* kNoPairsMessage = "None Pairs Found!";

    static void renderText(std::ostream& os, const app::services::PairReport& report,
                           app::services::ReportView view);

    static json toJson(const app::services::PairReport& report, app::services::ReportView view);

    static json errorToJson(const Error& error);
};

} // namespace pairdays::cli
