#pragma once

#include <pairdays/core/types.h>

#include <map>
#include <tuple>

namespace pairdays::engine {

/**
 * @brief One validated input row: an employee's date span on a project.
 *
 * dateFrom may be after dateTo; such a span never intersects anything.
 */
struct WorkAssignment {
    EmployeeId employeeId = 0;
    ProjectId projectId = 0;
    Date dateFrom;
    Date dateTo;

    bool operator==(const WorkAssignment&) const = default;
};

// Unordered pair of distinct employees stored as (low, high)
struct EmployeePair {
    EmployeeId low = 0;
    EmployeeId high = 0;

    static EmployeePair canonical(EmployeeId a, EmployeeId b) {
        return a < b ? EmployeePair{a, b} : EmployeePair{b, a};
    }

    bool operator==(const EmployeePair&) const = default;
    bool operator<(const EmployeePair& other) const {
        return std::tie(low, high) < std::tie(other.low, other.high);
    }
};

struct ProjectPairKey {
    EmployeePair pair;
    ProjectId projectId = 0;

    bool operator==(const ProjectPairKey&) const = default;
    bool operator<(const ProjectPairKey& other) const {
        return std::tie(pair, projectId) < std::tie(other.pair, other.projectId);
    }
};

// Overlap days a pair accumulated on one shared project
struct ProjectPairOverlap {
    EmployeeId employeeLow = 0;
    EmployeeId employeeHigh = 0;
    ProjectId projectId = 0;
    std::int64_t totalDaysWorked = 0;

    ProjectPairKey key() const { return {{employeeLow, employeeHigh}, projectId}; }

    bool operator==(const ProjectPairOverlap&) const = default;
};

// Overlap days a pair accumulated across every shared project
struct EmployeePairTotal {
    EmployeeId employeeLow = 0;
    EmployeeId employeeHigh = 0;
    std::int64_t totalDaysWorked = 0;

    EmployeePair pair() const { return {employeeLow, employeeHigh}; }

    bool operator==(const EmployeePairTotal&) const = default;
};

using ProjectPairOverlapMap = std::map<ProjectPairKey, ProjectPairOverlap>;
using EmployeePairTotalMap = std::map<EmployeePair, EmployeePairTotal>;

} // namespace pairdays::engine
