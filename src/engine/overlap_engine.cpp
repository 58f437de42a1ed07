#include <spdlog/spdlog.h>
#include <algorithm>
#include <pairdays/engine/overlap_engine.h>

namespace pairdays::engine {

std::optional<std::int64_t> OverlapEngine::overlapDays(const WorkAssignment& a,
                                                       const WorkAssignment& b) {
    const Date start = std::max(a.dateFrom, b.dateFrom);
    const Date end = std::min(a.dateTo, b.dateTo);
    if (end < start) {
        return std::nullopt;
    }
    // Both boundary days count as worked.
    return (end - start).count() + 1;
}

OverlapResult OverlapEngine::compute(std::span<const WorkAssignment> assignments) {
    OverlapResult result;
    size_t contributions = 0;

    for (size_t i = 0; i < assignments.size(); ++i) {
        for (size_t j = i + 1; j < assignments.size(); ++j) {
            const auto& p1 = assignments[i];
            const auto& p2 = assignments[j];
            if (p1.projectId != p2.projectId || p1.employeeId == p2.employeeId) {
                continue;
            }

            auto days = overlapDays(p1, p2);
            if (!days) {
                continue;
            }

            const auto pair = EmployeePair::canonical(p1.employeeId, p2.employeeId);

            auto projectIt = result.perProject
                                 .try_emplace(ProjectPairKey{pair, p1.projectId},
                                              ProjectPairOverlap{pair.low, pair.high, p1.projectId, 0})
                                 .first;
            projectIt->second.totalDaysWorked += *days;

            auto totalIt =
                result.totals.try_emplace(pair, EmployeePairTotal{pair.low, pair.high, 0}).first;
            totalIt->second.totalDaysWorked += *days;

            ++contributions;
        }
    }

    spdlog::debug("Overlap scan: {} assignments, {} overlapping record pairs, {} employee pairs, "
                  "{} project pairs",
                  assignments.size(), contributions, result.totals.size(),
                  result.perProject.size());
    return result;
}

} // namespace pairdays::engine
