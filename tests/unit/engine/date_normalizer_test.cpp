#include <gtest/gtest.h>
#include <pairdays/engine/date_normalizer.h>

using namespace pairdays;
using namespace pairdays::engine;
using namespace std::chrono;

namespace {

Date ymd(int y, unsigned m, unsigned d) {
    return sys_days{year{y} / month{m} / day{d}};
}

DateNormalizer fixedClock(Date today) {
    return DateNormalizer{[today]() { return today; }};
}

} // namespace

TEST(DateNormalizerTest, IsoDate) {
    auto r = DateNormalizer{}.normalize("2024-01-05");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), ymd(2024, 1, 5));
}

TEST(DateNormalizerTest, SlashDateIsMonthFirst) {
    auto r = DateNormalizer{}.normalize("03/04/2024");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), ymd(2024, 3, 4));
}

TEST(DateNormalizerTest, DashDateIsDayFirst) {
    auto r = DateNormalizer{}.normalize("03-04-2024");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), ymd(2024, 4, 3));
}

TEST(DateNormalizerTest, DayFirstSlashLayoutNeverWins) {
    // 25/12/2024 only makes sense as DD/MM/YYYY, but MM/DD/YYYY claims the shape first.
    auto r = DateNormalizer{}.normalize("25/12/2024");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidDate);
}

TEST(DateNormalizerTest, SurroundingWhitespaceIsTrimmed) {
    auto r = DateNormalizer{}.normalize("  2024-02-29\t");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), ymd(2024, 2, 29));
}

TEST(DateNormalizerTest, EmptyTokenIsToday) {
    auto r = fixedClock(ymd(2023, 6, 15)).normalize("");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), ymd(2023, 6, 15));
}

TEST(DateNormalizerTest, NullTokenIsTodayInAnyCase) {
    auto normalizer = fixedClock(ymd(2023, 6, 15));
    for (const char* token : {"null", "NULL", "Null", "nUlL"}) {
        auto r = normalizer.normalize(token);
        ASSERT_TRUE(r) << token;
        EXPECT_EQ(r.value(), ymd(2023, 6, 15)) << token;
    }
}

TEST(DateNormalizerTest, DefaultClockUsesSystemDate) {
    const Date before = DateNormalizer::systemToday();
    auto r = DateNormalizer{}.normalize("NULL");
    const Date after = DateNormalizer::systemToday();
    ASSERT_TRUE(r);
    EXPECT_GE(r.value(), before);
    EXPECT_LE(r.value(), after);
}

TEST(DateNormalizerTest, ImpossibleCalendarDatesAreRejected) {
    DateNormalizer normalizer;
    for (const char* token : {"2024-13-01", "2023-02-29", "2024-04-31", "13/01/2024", "32-01-2024",
                              "00/10/2024"}) {
        auto r = normalizer.normalize(token);
        ASSERT_FALSE(r) << token;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidDate) << token;
    }
}

TEST(DateNormalizerTest, LeapDayAccepted) {
    auto r = DateNormalizer{}.normalize("02/29/2024");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), ymd(2024, 2, 29));
}

TEST(DateNormalizerTest, FreeFormFallbackFormats) {
    DateNormalizer normalizer;
    struct Case {
        const char* token;
        Date expected;
    };
    const Case cases[] = {
        {"2024-01-05T10:30:00", ymd(2024, 1, 5)},
        {"2024-01-05T10:30:00Z", ymd(2024, 1, 5)},
        {"2024-01-05T10:00:00.000Z", ymd(2024, 1, 5)},
        {"2024-01-05T10:00:00+02:00", ymd(2024, 1, 5)},
        {"2024-01-05T23:30:00-0530", ymd(2024, 1, 5)},
        {"2024-01-05 08:00:00", ymd(2024, 1, 5)},
        {"1/5/2024", ymd(2024, 1, 5)},
        {"12/5/2024", ymd(2024, 12, 5)},
        {"2024/01/05", ymd(2024, 1, 5)},
        {"2024.01.05", ymd(2024, 1, 5)},
        {"5 Jan 2024", ymd(2024, 1, 5)},
        {"Jan 5 2024", ymd(2024, 1, 5)},
        {"January 5, 2024", ymd(2024, 1, 5)},
    };
    for (const auto& c : cases) {
        auto r = normalizer.normalize(c.token);
        ASSERT_TRUE(r) << c.token;
        EXPECT_EQ(r.value(), c.expected) << c.token;
    }
}

TEST(DateNormalizerTest, GarbageIsInvalidDate) {
    DateNormalizer normalizer;
    for (const char* token : {"yesterday", "2024", "2024-1-5x", "not a date", "1/2/x"}) {
        auto r = normalizer.normalize(token);
        ASSERT_FALSE(r) << token;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidDate) << token;
        EXPECT_NE(r.error().message.find("Unrecognized date"), std::string::npos);
    }
}

TEST(DateNormalizerTest, TimeSuffixOnlyFollowsTimeOfDay) {
    DateNormalizer normalizer;
    for (const char* token : {"2024/01/05Z", "2024.01.05+02:00", "1/5/2024.5",
                              "2024-01-05T10:00:00.Z", "2024-01-05T10:00:00+2"}) {
        auto r = normalizer.normalize(token);
        ASSERT_FALSE(r) << token;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidDate) << token;
    }
}

TEST(DateNormalizerTest, KnownFormatsOnlyConsultFirstMatchingShape) {
    EXPECT_EQ(DateNormalizer::parseKnownFormats("12/01/2024"), ymd(2024, 12, 1));
    EXPECT_FALSE(DateNormalizer::parseKnownFormats("31/01/2024").has_value());
    EXPECT_FALSE(DateNormalizer::parseKnownFormats("Jan 5 2024").has_value());
}

TEST(DateNormalizerTest, FormatISO) {
    EXPECT_EQ(DateNormalizer::formatISO(ymd(2024, 3, 9)), "2024-03-09");
}
