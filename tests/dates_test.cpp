#include <adr/dates.h>

#include <gtest/gtest.h>

#include <stdexcept>

namespace adr {
namespace {

TEST(DatesTest, FormatsEpochSecondsInUtc) {
  EXPECT_EQ("2024-03-01", FormatUtcDate(1709251200));
  EXPECT_EQ("2024-03-01T00:00:00Z", FormatUtcTimestamp(1709251200));
  EXPECT_EQ("1970-01-01T01:00:00Z", FormatUtcTimestamp(3600));
}

TEST(DatesTest, ParsesEpochSecondsAndCalendarDates) {
  EXPECT_EQ(1709251200, ParseDate("1709251200"));
  EXPECT_EQ(1709251200, ParseDate("2024-03-01"));
  EXPECT_EQ(0, ParseDate("1970-01-01"));
}

TEST(DatesTest, RejectsMalformedDates) {
  EXPECT_THROW(ParseDate(""), std::invalid_argument);
  EXPECT_THROW(ParseDate("yesterday"), std::invalid_argument);
  EXPECT_THROW(ParseDate("2024-13-01"), std::invalid_argument);
  EXPECT_THROW(ParseDate("2024/03/01"), std::invalid_argument);
}

} // namespace
} // namespace adr
