#pragma once

#include <pairdays/core/types.h>
#include <pairdays/engine/date_normalizer.h>
#include <pairdays/engine/records.h>

#include <optional>
#include <vector>

namespace pairdays::engine {

// Rows shorter than this are treated as filler and skipped
inline constexpr size_t kAssignmentFieldCount = 4;

struct ValidatedBatch {
    std::vector<WorkAssignment> assignments;
    size_t skippedRows = 0;
};

/**
 * Turns tokenized rows (EmpID, ProjectID, DateFrom, DateTo) into WorkAssignments.
 */
class RecordValidator {
public:
    explicit RecordValidator(DateNormalizer normalizer = DateNormalizer{});

    /**
     * @brief Validate one row
     * @return The assignment, std::nullopt for a short row, or ErrorCode::InvalidFormat
     */
    Result<std::optional<WorkAssignment>> validate(const Row& row) const;

    /**
     * @brief Validate every row; the first failure rejects the whole batch
     */
    Result<ValidatedBatch> validateBatch(const std::vector<Row>& rows) const;

    static std::optional<std::int64_t> parseInteger(std::string_view token);

private:
    DateNormalizer normalizer_;
};

} // namespace pairdays::engine
