#include <gtest/gtest.h>
#include "utils/TimeUtils.hpp"
#include <cstdlib>
#include <ctime>

using namespace Pequod;

namespace {
// 2006-01-02T15:04:05Z
const Timestamp kReference = 1136214245;
}

TEST(Rfc822Test, ParsesNumericOffset) {
    auto ts = parseRfc822("Mon, 02 Jan 2006 15:04:05 -0700");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, kReference + 7 * 3600);
}

TEST(Rfc822Test, ParsesNamedZones) {
    EXPECT_EQ(parseRfc822("Mon, 02 Jan 2006 15:04:05 GMT"), kReference);
    EXPECT_EQ(parseRfc822("Mon, 02 Jan 2006 10:04:05 EST"), kReference);
}

TEST(Rfc822Test, WeekdayAndSecondsAreOptional) {
    EXPECT_EQ(parseRfc822("02 Jan 2006 15:04:05 +0000"), kReference);
    EXPECT_EQ(parseRfc822("Mon, 02 Jan 2006 15:04 GMT"), kReference - 5);
}

TEST(Rfc822Test, RejectsGarbage) {
    EXPECT_FALSE(parseRfc822("yesterday").has_value());
    EXPECT_FALSE(parseRfc822("Mon, 02 Foo 2006 15:04:05 GMT").has_value());
    EXPECT_FALSE(parseRfc822("Mon, 02 Jan 2006 15:04:05 Mars").has_value());
}

TEST(Rfc3339Test, ParsesUtcAndOffsets) {
    EXPECT_EQ(parseRfc3339("2006-01-02T15:04:05Z"), kReference);
    EXPECT_EQ(parseRfc3339("2006-01-02T22:04:05+07:00"), kReference);
    EXPECT_EQ(parseRfc3339("2006-01-02T15:04:05.999Z"), kReference);
}

TEST(Rfc3339Test, DateOnlyIsMidnightUtc) {
    EXPECT_EQ(parseRfc3339("2006-01-02"), kReference - (15 * 3600 + 4 * 60 + 5));
}

TEST(Rfc3339Test, RejectsGarbage) {
    EXPECT_FALSE(parseRfc3339("2006/01/02").has_value());
    EXPECT_FALSE(parseRfc3339("2006-13-02T00:00:00Z").has_value());
}

TEST(FeedDateTest, AcceptsEitherFormat) {
    EXPECT_EQ(parseFeedDate("2006-01-02T15:04:05Z"), kReference);
    EXPECT_EQ(parseFeedDate("Mon, 02 Jan 2006 15:04:05 GMT"), kReference);
    EXPECT_FALSE(parseFeedDate("").has_value());
}

TEST(FormatTimestampTest, UsesLocalTime) {
    setenv("TZ", "UTC", 1);
    tzset();
    EXPECT_EQ(formatTimestamp(kReference), "2006-01-02 03:04PM");
    EXPECT_EQ(formatTimestamp(kReference, "%Y-%m-%d"), "2006-01-02");
}
