#include "rolodex/core/timestamp.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace rolodex;
using namespace std::chrono;

namespace {

timestamp at(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0, int ms = 0) {
    return timestamp{sys_days{year{y} / month{m} / day{d}}.time_since_epoch() + hours{hh} +
                     minutes{mm} + seconds{ss} + milliseconds{ms}};
}

} // namespace

TEST(Timestamp, FormatsWithMilliseconds) {
    EXPECT_EQ(format_iso8601(at(2023, 1, 15, 10, 30, 0, 0)), "2023-01-15T10:30:00.000Z");
    EXPECT_EQ(format_iso8601(at(1999, 12, 31, 23, 59, 59, 7)), "1999-12-31T23:59:59.007Z");
}

TEST(Timestamp, ParsesCanonicalForm) {
    auto ts = parse_iso8601("2023-01-15T10:30:00.000Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, at(2023, 1, 15, 10, 30));
}

TEST(Timestamp, ParsesDateOnlyAsMidnightUtc) {
    auto ts = parse_iso8601("2020-02-29");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_iso8601(*ts), "2020-02-29T00:00:00.000Z");
}

TEST(Timestamp, ParsesVariants) {
    EXPECT_EQ(parse_iso8601("2023-01-15T10:30"), at(2023, 1, 15, 10, 30));
    EXPECT_EQ(parse_iso8601("2023-01-15 10:30:05"), at(2023, 1, 15, 10, 30, 5));
    EXPECT_EQ(parse_iso8601("2023-01-15t10:30:05z"), at(2023, 1, 15, 10, 30, 5));
    EXPECT_EQ(parse_iso8601("2023-01-15T10:30:05.5Z"), at(2023, 1, 15, 10, 30, 5, 500));
    EXPECT_EQ(parse_iso8601("2023-01-15T10:30:05.123456Z"), at(2023, 1, 15, 10, 30, 5, 123));
}

TEST(Timestamp, AppliesOffsets) {
    EXPECT_EQ(parse_iso8601("2023-01-15T12:30:00+02:00"), at(2023, 1, 15, 10, 30));
    EXPECT_EQ(parse_iso8601("2023-01-15T05:00:00-0530"), at(2023, 1, 15, 10, 30));
    EXPECT_EQ(parse_iso8601("2023-01-01T01:00:00+02:00"), at(2022, 12, 31, 23, 0));
}

TEST(Timestamp, RejectsInvalidText) {
    for (const char* text : {"", "not-a-date", "2023", "2023-1-15", "2023-02-30",
                             "2023-13-01", "2023-01-15T", "2023-01-15T24:00",
                             "2023-01-15T10:60", "2023-01-15T10:30:61", "2023-01-15T10:30:00.",
                             "2023-01-15T10:30:00Zjunk", "2023-01-15Z", "2023-01-15T10:30+5"}) {
        EXPECT_FALSE(parse_iso8601(text).has_value()) << text;
    }
}

TEST(Timestamp, RejectsOffsetsLeavingFourDigitYears) {
    EXPECT_FALSE(parse_iso8601("9999-12-31T23:30:00-01:00").has_value());
    EXPECT_FALSE(parse_iso8601("0000-01-01T00:30:00+01:00").has_value());

    auto edge = parse_iso8601("9999-12-31T22:30:00-01:00");
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(format_iso8601(*edge), "9999-12-31T23:30:00.000Z");
    EXPECT_EQ(parse_iso8601(format_iso8601(*edge)), edge);
}

TEST(Timestamp, NoOffsetMeansUtc) {
    EXPECT_EQ(parse_iso8601("2024-01-15T10:30:00"), parse_iso8601("2024-01-15T10:30:00Z"));
}

TEST(Timestamp, FormatThenParseIsStable) {
    auto now = now_utc();
    auto text = format_iso8601(now);
    auto parsed = parse_iso8601(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, now);
}
