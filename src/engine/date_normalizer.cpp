#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <regex>
#include <sstream>
#include <pairdays/config/config_helpers.h>
#include <pairdays/engine/date_normalizer.h>

namespace pairdays::engine {

namespace {

enum class FieldOrder { YearMonthDay, MonthDayYear, DayMonthYear };

struct DateLayout {
    const char* name;
    std::regex shape;
    char separator;
    FieldOrder order;
};

const std::array<DateLayout, 4>& knownLayouts() {
    // Order matters: MM/DD/YYYY shadows DD/MM/YYYY.
    static const std::array<DateLayout, 4> layouts = {{
        {"YYYY-MM-DD", std::regex(R"(^\d{4}-\d{2}-\d{2}$)"), '-', FieldOrder::YearMonthDay},
        {"MM/DD/YYYY", std::regex(R"(^\d{2}/\d{2}/\d{4}$)"), '/', FieldOrder::MonthDayYear},
        {"DD-MM-YYYY", std::regex(R"(^\d{2}-\d{2}-\d{4}$)"), '-', FieldOrder::DayMonthYear},
        {"DD/MM/YYYY", std::regex(R"(^\d{2}/\d{2}/\d{4}$)"), '/', FieldOrder::DayMonthYear},
    }};
    return layouts;
}

struct FreeFormLayout {
    const char* format;
    bool timeOfDay; // may be followed by fractional seconds and a UTC designator
};

// Layouts tried by the free-form fallback, all in the classic locale
constexpr std::array<FreeFormLayout, 10> kFreeFormLayouts = {{
    {"%Y-%m-%dT%H:%M:%S", true},
    {"%Y-%m-%d %H:%M:%S", true},
    {"%Y/%m/%d", false},
    {"%Y.%m.%d", false},
    {"%m/%d/%Y", false},
    {"%d %b %Y", false},
    {"%b %d %Y", false},
    {"%B %d, %Y", false},
    {"%b %d, %Y", false},
    {"%d %B %Y", false},
}};

// ".123", "Z", "+02:00", "-0530" or combinations after the seconds field
bool isTimeSuffix(const std::string& rest) {
    static const std::regex suffix(R"(^(\.\d{1,9})?(Z|[+-]\d{2}:?\d{2})?$)");
    return std::regex_match(rest, suffix);
}

std::optional<Date> makeDate(int year, unsigned month, unsigned day) {
    const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                          std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
}

std::optional<Date> fromLayout(const DateLayout& layout, const std::string& token) {
    std::array<int, 3> parts{};
    std::stringstream ss(token);
    std::string part;
    for (size_t i = 0; i < parts.size() && std::getline(ss, part, layout.separator); ++i) {
        parts[i] = std::stoi(part);
    }

    switch (layout.order) {
        case FieldOrder::YearMonthDay:
            return makeDate(parts[0], static_cast<unsigned>(parts[1]),
                            static_cast<unsigned>(parts[2]));
        case FieldOrder::MonthDayYear:
            return makeDate(parts[2], static_cast<unsigned>(parts[0]),
                            static_cast<unsigned>(parts[1]));
        case FieldOrder::DayMonthYear:
            return makeDate(parts[2], static_cast<unsigned>(parts[1]),
                            static_cast<unsigned>(parts[0]));
    }
    return std::nullopt;
}

bool isNullToken(std::string_view token) {
    if (token.size() != 4) {
        return false;
    }
    std::string lower(token);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "null";
}

} // namespace

DateNormalizer::DateNormalizer() : today_(&DateNormalizer::systemToday) {}

DateNormalizer::DateNormalizer(TodayProvider today)
    : today_(today ? std::move(today) : TodayProvider(&DateNormalizer::systemToday)) {}

Result<Date> DateNormalizer::normalize(std::string_view token) const {
    if (token.empty() || isNullToken(token)) {
        const Date today = today_();
        spdlog::debug("Date token '{}' defaulted to today ({})", token, formatISO(today));
        return today;
    }

    std::string trimmed(token);
    config::trim(trimmed);

    if (auto date = parseKnownFormats(trimmed)) {
        return *date;
    }

    if (auto date = parseFreeForm(trimmed)) {
        spdlog::trace("Date token '{}' accepted by free-form parser", trimmed);
        return *date;
    }

    return Error{ErrorCode::InvalidDate, fmt::format("Unrecognized date '{}'", trimmed)};
}

std::optional<Date> DateNormalizer::parseKnownFormats(const std::string& token) {
    for (const auto& layout : knownLayouts()) {
        if (!std::regex_match(token, layout.shape)) {
            continue;
        }
        auto date = fromLayout(layout, token);
        if (!date) {
            spdlog::trace("Date '{}' matched {} but is not a calendar date", token, layout.name);
        }
        // First matching shape decides, valid or not.
        return date;
    }
    return std::nullopt;
}

std::optional<Date> DateNormalizer::parseFreeForm(const std::string& token) {
    for (const auto& layout : kFreeFormLayouts) {
        std::tm tm = {};
        std::istringstream ss(token);
        ss.imbue(std::locale::classic());
        ss >> std::get_time(&tm, layout.format);
        if (ss.fail()) {
            continue;
        }

        std::string rest;
        std::getline(ss, rest);
        config::trim(rest);
        if (!rest.empty() && !(layout.timeOfDay && isTimeSuffix(rest))) {
            continue;
        }

        if (auto date = makeDate(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                                 static_cast<unsigned>(tm.tm_mday))) {
            return date;
        }
    }
    return std::nullopt;
}

Date DateNormalizer::systemToday() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
    if (localtime_r(&now, &tm) == nullptr) {
        // No local time zone data; fall back to the UTC calendar date.
        return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    }
    return std::chrono::sys_days{std::chrono::year_month_day{
        std::chrono::year{tm.tm_year + 1900}, std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm.tm_mday)}}};
}

std::string DateNormalizer::formatISO(Date date) {
    const std::chrono::year_month_day ymd{date};
    return fmt::format("{:04d}-{:02d}-{:02d}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

} // namespace pairdays::engine
