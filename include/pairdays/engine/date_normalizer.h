#pragma once

#include <pairdays/core/types.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pairdays::engine {

// Supplies the calendar date used for empty / "null" date tokens
using TodayProvider = std::function<Date()>;

/**
 * @brief Converts textual date tokens into calendar dates
 *
 * Recognized layouts, tried in this order; the first layout whose shape
 * matches decides:
 * - "YYYY-MM-DD"
 * - "MM/DD/YYYY"
 * - "DD-MM-YYYY"
 * - "DD/MM/YYYY"  (same shape as MM/DD/YYYY and listed after it, so it never
 *                  wins; kept for compatibility with existing input files)
 *
 * Tokens matching none of these, or whose matched layout does not give a real
 * calendar date, go through a generic free-form parser.
 * An empty token or "null" (any case) means today.
 */
class DateNormalizer {
public:
    DateNormalizer();
    explicit DateNormalizer(TodayProvider today);

    /**
     * @brief Normalize a single date token
     * @param token Raw field text
     * @return Calendar date, or ErrorCode::InvalidDate
     */
    Result<Date> normalize(std::string_view token) const;

    /**
     * @brief Parse using only the fixed layouts, in precedence order
     * @return Date from the first layout whose shape matches, or nullopt when
     *         none matches or the matched components are not a real date
     */
    static std::optional<Date> parseKnownFormats(const std::string& token);

    /**
     * @brief Free-form fallback
     *
     * Month names, unpadded M/D/YYYY, dotted and slashed ISO order, and ISO
     * date-time with optional fractional seconds and Z or +HH:MM offset. The
     * offset is not applied: the date is the one written in the token.
     */
    static std::optional<Date> parseFreeForm(const std::string& token);

    // Local wall-clock date
    static Date systemToday();

    static std::string formatISO(Date date);

private:
    TodayProvider today_;
};

} // namespace pairdays::engine
