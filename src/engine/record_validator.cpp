#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <charconv>
#include <pairdays/engine/record_validator.h>

namespace pairdays::engine {

namespace {

Error formatError(size_t rowNumber, const std::string& detail) {
    if (rowNumber == 0) {
        return Error{ErrorCode::InvalidFormat, "Invalid data format: " + detail};
    }
    return Error{ErrorCode::InvalidFormat,
                 fmt::format("Invalid data format in row {}: {}", rowNumber, detail)};
}

Result<std::optional<WorkAssignment>> validateRow(const DateNormalizer& normalizer, const Row& row,
                                                  size_t rowNumber) {
    if (row.size() < kAssignmentFieldCount) {
        return std::optional<WorkAssignment>{};
    }

    auto employeeId = RecordValidator::parseInteger(row[0]);
    if (!employeeId) {
        return formatError(rowNumber, fmt::format("employee id '{}' is not a number", row[0]));
    }

    auto projectId = RecordValidator::parseInteger(row[1]);
    if (!projectId) {
        return formatError(rowNumber, fmt::format("project id '{}' is not a number", row[1]));
    }

    auto dateFrom = normalizer.normalize(row[2]);
    if (!dateFrom) {
        return formatError(rowNumber, fmt::format("DateFrom: {}", dateFrom.error().message));
    }

    auto dateTo = normalizer.normalize(row[3]);
    if (!dateTo) {
        return formatError(rowNumber, fmt::format("DateTo: {}", dateTo.error().message));
    }

    return std::optional<WorkAssignment>{
        WorkAssignment{*employeeId, *projectId, dateFrom.value(), dateTo.value()}};
}

} // namespace

RecordValidator::RecordValidator(DateNormalizer normalizer) : normalizer_(std::move(normalizer)) {}

std::optional<std::int64_t> RecordValidator::parseInteger(std::string_view token) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && token.front() == '-') {
            return std::nullopt;
        }
    }
    if (token.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const auto* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

Result<std::optional<WorkAssignment>> RecordValidator::validate(const Row& row) const {
    return validateRow(normalizer_, row, 0);
}

Result<ValidatedBatch> RecordValidator::validateBatch(const std::vector<Row>& rows) const {
    ValidatedBatch batch;
    batch.assignments.reserve(rows.size());

    for (size_t i = 0; i < rows.size(); ++i) {
        auto result = validateRow(normalizer_, rows[i], i + 1);
        if (!result) {
            spdlog::warn("Rejecting batch of {} rows: {}", rows.size(), result.error().message);
            return result.error();
        }
        if (const auto& assignment = result.value()) {
            batch.assignments.push_back(*assignment);
        } else {
            ++batch.skippedRows;
        }
    }

    spdlog::debug("Validated {} assignments ({} short rows skipped)", batch.assignments.size(),
                  batch.skippedRows);
    return batch;
}

} // namespace pairdays::engine
