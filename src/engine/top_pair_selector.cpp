#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <pairdays/engine/top_pair_selector.h>

namespace pairdays::engine {

std::vector<EmployeePairTotal> TopPairSelector::winners(const EmployeePairTotalMap& totals) {
    std::vector<EmployeePairTotal> out;
    if (totals.empty()) {
        return out;
    }

    const auto best = std::max_element(totals.begin(), totals.end(), [](const auto& a, const auto& b) {
        return a.second.totalDaysWorked < b.second.totalDaysWorked;
    });
    const std::int64_t maxTotal = best->second.totalDaysWorked;

    for (const auto& [pair, total] : totals) {
        if (total.totalDaysWorked == maxTotal) {
            out.push_back(total);
        }
    }
    return out;
}

std::vector<ProjectPairOverlap> TopPairSelector::select(const EmployeePairTotalMap& totals,
                                                        const ProjectPairOverlapMap& perProject) {
    std::vector<ProjectPairOverlap> out;
    const auto top = winners(totals);
    if (top.empty()) {
        return out;
    }

    std::set<EmployeePair> winning;
    for (const auto& total : top) {
        winning.insert(total.pair());
    }

    // perProject is keyed by (pair, project), so the output is already in key order.
    for (const auto& [key, overlap] : perProject) {
        if (winning.count(key.pair) != 0) {
            out.push_back(overlap);
        }
    }

    spdlog::debug("Top pairs: {} pair(s) at {} days, {} project row(s)", top.size(),
                  top.front().totalDaysWorked, out.size());
    return out;
}

} // namespace pairdays::engine
