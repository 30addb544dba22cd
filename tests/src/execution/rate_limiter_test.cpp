#include <agentid/execution/rate_limiter.hpp>
#include <agentid/testing/common.hpp>
#include <gtest/gtest.h>

#include <vector>

using agentid::schema::kMillisecondsPerMinute;

TEST(rate_limiter, admits_up_to_the_limit_per_window) {
  auto clock = agentid::testing::manual_clock{};
  auto limiter = agentid::execution::rate_limiter{clock.fn()};
  for (auto expected : {uint64_t{2}, uint64_t{1}, uint64_t{0}}) {
    auto decision = limiter.consume("k", 3, kMillisecondsPerMinute);
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.remaining, expected);
  }
  auto denied = limiter.consume("k", 3, kMillisecondsPerMinute);
  EXPECT_FALSE(denied.allowed);
  EXPECT_EQ(denied.remaining, 0u);
  EXPECT_EQ(denied.reset_at, clock.now() + kMillisecondsPerMinute);
}

TEST(rate_limiter, window_resets_after_it_elapses) {
  auto clock = agentid::testing::manual_clock{};
  auto limiter = agentid::execution::rate_limiter{clock.fn()};
  EXPECT_TRUE(limiter.consume("k", 1, kMillisecondsPerMinute).allowed);
  EXPECT_FALSE(limiter.consume("k", 1, kMillisecondsPerMinute).allowed);
  clock.advance(kMillisecondsPerMinute);
  EXPECT_TRUE(limiter.consume("k", 1, kMillisecondsPerMinute).allowed);
}

TEST(rate_limiter, keys_are_independent) {
  auto clock = agentid::testing::manual_clock{};
  auto limiter = agentid::execution::rate_limiter{clock.fn()};
  EXPECT_TRUE(limiter.consume("a", 1, kMillisecondsPerMinute).allowed);
  EXPECT_TRUE(limiter.consume("b", 1, kMillisecondsPerMinute).allowed);
  EXPECT_FALSE(limiter.consume("a", 1, kMillisecondsPerMinute).allowed);
}

TEST(rate_limiter, purge_drops_only_elapsed_windows) {
  auto clock = agentid::testing::manual_clock{};
  auto limiter = agentid::execution::rate_limiter{clock.fn()};
  limiter.consume("short", 5, kMillisecondsPerMinute);
  limiter.consume("long", 5, 10 * kMillisecondsPerMinute);
  EXPECT_EQ(limiter.purge_expired(), 0u);
  clock.advance(2 * kMillisecondsPerMinute);
  EXPECT_EQ(limiter.purge_expired(), 1u);
}

TEST(rate_limiter, consume_all_charges_nothing_on_denial) {
  auto clock = agentid::testing::manual_clock{};
  auto limiter = agentid::execution::rate_limiter{clock.fn()};
  auto requests = std::vector<agentid::execution::rate_limit_request>{
      {.key = "minute", .limit = 2, .window = kMillisecondsPerMinute},
      {.key = "day", .limit = 1, .window = agentid::schema::kMillisecondsPerDay}};

  auto first = limiter.consume_all(requests);
  ASSERT_EQ(first.size(), 2u);
  EXPECT_TRUE(first[0].allowed);
  EXPECT_EQ(first[0].remaining, 1u);
  EXPECT_TRUE(first[1].allowed);
  EXPECT_EQ(first[1].remaining, 0u);

  auto second = limiter.consume_all(requests);
  EXPECT_TRUE(second[0].allowed);
  EXPECT_EQ(second[0].remaining, 1u);
  EXPECT_FALSE(second[1].allowed);

  // The denied call above left the minute window at one request.
  auto minute = limiter.consume("minute", 2, kMillisecondsPerMinute);
  EXPECT_TRUE(minute.allowed);
  EXPECT_EQ(minute.remaining, 0u);
}
