#pragma once
#include <string>
#include <string_view>
#include <pairdays/core/types.h>

namespace pairdays::cli {

/**
 * Centralized error hint system for CLI.
 * Provides actionable hints based on error codes and message patterns.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

/**
 * Get an actionable hint for a given error.
 *
 * @param code The ErrorCode enum value
 * @param message The error message (used for pattern matching)
 * @param command The command that was executing (for context)
 * @return An ErrorHint with actionable suggestions
 */
inline ErrorHint getErrorHint(ErrorCode code, std::string_view message,
                              std::string_view command = "") {
    ErrorHint hint;

    // Pattern-based hints (check message content first for specificity)
    if (message.find("DateFrom") != std::string_view::npos ||
        message.find("DateTo") != std::string_view::npos ||
        message.find("Unrecognized date") != std::string_view::npos) {
        hint.hint = "Dates must look like YYYY-MM-DD, MM/DD/YYYY or DD-MM-YYYY "
                    "(empty or NULL means today)";
        return hint;
    }

    if (message.find("employee id") != std::string_view::npos ||
        message.find("project id") != std::string_view::npos) {
        hint.hint = "Expected rows of EmpID, ProjectID, DateFrom, DateTo with numeric ids";
        hint.command = "pairdays analyze --skip-header <file>";
        return hint;
    }

    if (message.find("Delimiter") != std::string_view::npos) {
        hint.hint = "Use a single character such as ',' ';' '|' or \\t";
        return hint;
    }

    if (message.find("not text") != std::string_view::npos) {
        hint.hint = "The input looks binary; export it as plain CSV text";
        return hint;
    }

    // Error code-based hints (fallback)
    switch (code) {
        case ErrorCode::FileNotFound:
            hint.hint = "Verify the file path exists and is accessible";
            break;

        case ErrorCode::PermissionDenied:
            hint.hint = "Check file/directory permissions";
            break;

        case ErrorCode::ReadError:
            hint.hint = "The input could not be read completely; check the file and try again";
            break;

        case ErrorCode::InvalidDate:
            hint.hint = "Dates must look like YYYY-MM-DD, MM/DD/YYYY or DD-MM-YYYY";
            break;

        case ErrorCode::InvalidFormat:
            hint.hint = "Expected rows of EmpID, ProjectID, DateFrom, DateTo";
            break;

        case ErrorCode::InvalidArgument:
            hint.hint = "Check command syntax";
            hint.command = command.empty() ? "pairdays --help"
                                           : std::string("pairdays ") + std::string(command) +
                                                 " --help";
            break;

        default:
            // No specific hint available
            break;
    }

    return hint;
}

/**
 * Format an error message with an actionable hint.
 *
 * @param code The ErrorCode enum value
 * @param message The error message
 * @param command The command that was executing (for context)
 * @return Formatted error message with hint
 */
inline std::string formatErrorWithHint(ErrorCode code, std::string_view message,
                                       std::string_view command = "") {
    auto hint = getErrorHint(code, message, command);

    std::string result(message);

    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }

    return result;
}

} // namespace pairdays::cli
