#pragma once

#include <pairdays/engine/records.h>

#include <vector>

namespace pairdays::engine {

/**
 * Picks the employee pair(s) with the largest total overlap. Ties are all
 * kept; nothing is chosen arbitrarily.
 */
class TopPairSelector {
public:
    // Pairs whose total equals the maximum, in pair order; empty for empty input
    static std::vector<EmployeePairTotal> winners(const EmployeePairTotalMap& totals);

    // Per-project rows of the winning pairs, ordered by (low, high, project)
    static std::vector<ProjectPairOverlap> select(const EmployeePairTotalMap& totals,
                                                  const ProjectPairOverlapMap& perProject);
};

} // namespace pairdays::engine
