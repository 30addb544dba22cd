#include <agentid/common/time.hpp>
#include <agentid/testing/common.hpp>
#include <gtest/gtest.h>

TEST(time, formats_utc_with_milliseconds) {
  EXPECT_EQ(agentid::common::format_iso8601(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(agentid::common::format_iso8601(agentid::testing::kMonday10am + 42),
            "2025-01-06T10:00:00.042Z");
}

TEST(time, parses_zulu_offsets_and_dates) {
  EXPECT_EQ(agentid::common::parse_iso8601("2025-01-06T10:00:00Z"),
            agentid::testing::kMonday10am);
  EXPECT_EQ(agentid::common::parse_iso8601("2025-01-06T10:00:00.500Z"),
            agentid::testing::kMonday10am + 500);
  EXPECT_EQ(agentid::common::parse_iso8601("2025-01-06T12:00:00+02:00"),
            agentid::testing::kMonday10am);
  EXPECT_EQ(agentid::common::parse_iso8601("2025-01-06"),
            agentid::testing::kMonday10am - 10 * agentid::schema::kMillisecondsPerHour);
}

TEST(time, rejects_malformed_input) {
  EXPECT_FALSE(agentid::common::parse_iso8601(""));
  EXPECT_FALSE(agentid::common::parse_iso8601("tomorrow"));
  EXPECT_FALSE(agentid::common::parse_iso8601("2025-02-30T00:00:00Z"));
  EXPECT_FALSE(agentid::common::parse_iso8601("2025-01-06T25:00:00Z"));
}

TEST(time, round_trips_formatted_values) {
  auto now = agentid::testing::kMonday10am + 123456789;
  EXPECT_EQ(agentid::common::parse_iso8601(agentid::common::format_iso8601(now)),
            now);
}

TEST(time, utc_calendar_fields) {
  EXPECT_EQ(agentid::common::utc_hour(agentid::testing::kMonday10am), 10u);
  EXPECT_EQ(agentid::common::utc_weekday(agentid::testing::kMonday10am), 1u);
  EXPECT_EQ(agentid::common::utc_weekday(0), 4u);  // 1970-01-01 was a Thursday
  EXPECT_EQ(agentid::common::utc_minute_of_day(agentid::testing::kMonday10am +
                                               90 * 1000),
            601u);
}
