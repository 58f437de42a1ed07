#pragma once

#include <pairdays/engine/records.h>

#include <optional>
#include <span>
#include <vector>

namespace pairdays::engine {

struct OverlapResult {
    ProjectPairOverlapMap perProject;
    EmployeePairTotalMap totals;
};

/**
 * Pairwise interval intersection over all assignments.
 *
 * Every unordered pair of records is examined once (O(n^2)). Two records
 * contribute when they share a project, belong to different employees and
 * their date spans intersect; the contribution is the inclusive day count of
 * the intersection, added both to the (pair, project) entry and to the pair
 * total.
 */
class OverlapEngine {
public:
    static OverlapResult compute(std::span<const WorkAssignment> assignments);

    // Inclusive day count shared by two spans, nullopt when they do not intersect
    static std::optional<std::int64_t> overlapDays(const WorkAssignment& a,
                                                   const WorkAssignment& b);
};

} // namespace pairdays::engine
