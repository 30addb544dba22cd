#include <agentid/execution/permission_evaluator.hpp>
#include <agentid/testing/common.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using agentid::execution::check_permission;
using agentid::execution::permission_context;
using agentid::execution::permission_request;
using agentid::schema::json_t;

TEST(permission_evaluator, standard_actions_cover_qualified_requests) {
  EXPECT_TRUE(agentid::execution::action_matches("read", "read"));
  EXPECT_TRUE(agentid::execution::action_matches("read:orders", "read"));
  EXPECT_FALSE(agentid::execution::action_matches("reader", "read"));
  EXPECT_TRUE(agentid::execution::action_matches("payments:refund", "payments:*"));
  EXPECT_FALSE(agentid::execution::action_matches("deploy:prod", "deploy"));
}

TEST(permission_evaluator, resource_patterns) {
  EXPECT_TRUE(agentid::execution::resource_matches("orders/42", "*"));
  EXPECT_TRUE(agentid::execution::resource_matches("orders/42", "orders/*"));
  EXPECT_FALSE(agentid::execution::resource_matches("invoices/1", "orders/*"));
}

TEST(permission_evaluator, normalizes_every_permission_shape) {
  auto strings = agentid::execution::normalize_permissions(
      json_t::array({"read", "write"}));
  ASSERT_EQ(strings.size(), 2u);

  auto policy_entries = agentid::execution::normalize_permissions(json_t::parse(
      R"([{"resource":"orders/*","actions":["read","write"],"conditions":{"valid_days":["monday"]}}])"));
  ASSERT_EQ(policy_entries.size(), 2u);
  EXPECT_EQ(policy_entries[1].action, "write");
  EXPECT_EQ(policy_entries[1].resources, std::vector<std::string>{"orders/*"});

  auto legacy = agentid::execution::normalize_permissions(json_t::parse(
      R"({"actions":["transact"],"domains":["shop"],"resource_limits":{"max_transaction_value":500}})"));
  ASSERT_EQ(legacy.size(), 1u);
  EXPECT_EQ(legacy[0].conditions.at("max_transaction_amount"), 500);
  EXPECT_EQ(legacy[0].domains, std::vector<std::string>{"shop"});

  EXPECT_TRUE(agentid::execution::normalize_permissions(json_t{"read"}).empty());
}

TEST(permission_evaluator, denies_unlisted_actions) {
  auto result = check_permission(permission_request{.action = "delete"},
                                 json_t::array({"read"}), permission_context{});
  EXPECT_FALSE(result.granted);
  EXPECT_EQ(result.reason, std::optional<std::string>{"Action 'delete' is not permitted"});
}

TEST(permission_evaluator, time_conditions_wrap_midnight) {
  auto permissions = json_t::parse(
      R"([{"action":"read","conditions":{"valid_hours":{"start":22,"end":6}}}])");
  auto at = [&](uint32_t hour) {
    return check_permission(permission_request{.action = "read"}, permissions,
                            permission_context{.hour = hour})
        .granted;
  };
  EXPECT_TRUE(at(23));
  EXPECT_TRUE(at(3));
  EXPECT_TRUE(at(6));
  EXPECT_FALSE(at(12));
}

TEST(permission_evaluator, day_and_region_conditions) {
  auto permissions = json_t::parse(
      R"([{"action":"write","conditions":{"valid_days":["monday","tuesday"],"allowed_regions":["US","CA"]}}])");
  auto granted = check_permission(
      permission_request{.action = "write"}, permissions,
      permission_context{.region = "US", .day = "Monday"});
  EXPECT_TRUE(granted.granted);
  EXPECT_EQ(granted.conditions_applied,
            (std::vector<std::string>{"valid_days", "allowed_regions"}));

  auto wrong_day = check_permission(permission_request{.action = "write"},
                                    permissions,
                                    permission_context{.day = "sunday"});
  EXPECT_FALSE(wrong_day.granted);

  auto wrong_region = check_permission(permission_request{.action = "write"},
                                       permissions,
                                       permission_context{.region = "FR"});
  EXPECT_FALSE(wrong_region.granted);
  EXPECT_EQ(wrong_region.reason,
            std::optional<std::string>{"Action not permitted from region: FR"});
}

TEST(permission_evaluator, rate_limits_apply_per_credential) {
  auto clock = agentid::testing::manual_clock{};
  auto limiter = agentid::execution::rate_limiter{clock.fn()};
  auto permissions = json_t::parse(
      R"([{"action":"read","conditions":{"max_requests_per_minute":2}}])");
  auto context = permission_context{.credential_id = "c-1"};
  auto request = permission_request{.action = "read"};

  auto first = check_permission(request, permissions, context, &limiter);
  ASSERT_TRUE(first.granted);
  ASSERT_TRUE(first.rate_limit);
  EXPECT_EQ(first.rate_limit->minute_remaining, 1u);
  EXPECT_TRUE(check_permission(request, permissions, context, &limiter).granted);
  auto third = check_permission(request, permissions, context, &limiter);
  EXPECT_FALSE(third.granted);
  EXPECT_EQ(third.reason,
            std::optional<std::string>{"Rate limit exceeded: 2 requests per minute"});

  auto other = permission_context{.credential_id = "c-2"};
  EXPECT_TRUE(check_permission(request, permissions, other, &limiter).granted);

  // Without a limiter the condition is only reported.
  auto noted = check_permission(request, permissions, context);
  EXPECT_TRUE(noted.granted);
  EXPECT_EQ(noted.conditions_applied,
            std::vector<std::string>{"max_requests_per_minute"});
}

TEST(permission_evaluator, daily_denial_leaves_the_minute_budget) {
  auto clock = agentid::testing::manual_clock{};
  auto limiter = agentid::execution::rate_limiter{clock.fn()};
  auto permissions = json_t::parse(R"([{"action":"read","conditions":{
      "max_requests_per_minute":2,"max_requests_per_day":1}}])");
  auto context = permission_context{.credential_id = "c-1"};
  auto request = permission_request{.action = "read"};

  ASSERT_TRUE(check_permission(request, permissions, context, &limiter).granted);
  auto capped = check_permission(request, permissions, context, &limiter);
  EXPECT_FALSE(capped.granted);
  EXPECT_EQ(capped.reason,
            std::optional<std::string>{"Daily rate limit exceeded: 1 requests per day"});
  ASSERT_TRUE(capped.rate_limit);
  EXPECT_EQ(capped.rate_limit->minute_remaining, 1u);
}

TEST(permission_evaluator, positive_limits) {
  using agentid::execution::positive_limit;
  auto limits = json_t::parse(R"({"three":3,"fraction":2.7,"half":0.5,
      "negative":-4,"huge":1e300,"text":"3","max":18446744073709551615})");
  EXPECT_EQ(positive_limit(limits, "three"), std::optional<uint64_t>{3});
  EXPECT_EQ(positive_limit(limits, "fraction"), std::optional<uint64_t>{2});
  EXPECT_FALSE(positive_limit(limits, "half"));
  EXPECT_FALSE(positive_limit(limits, "negative"));
  EXPECT_FALSE(positive_limit(limits, "text"));
  EXPECT_FALSE(positive_limit(limits, "absent"));
  EXPECT_FALSE(positive_limit(json_t::array({1}), "three"));
  EXPECT_EQ(positive_limit(limits, "huge"),
            std::optional<uint64_t>{std::numeric_limits<uint64_t>::max()});
  EXPECT_EQ(positive_limit(limits, "max"),
            std::optional<uint64_t>{std::numeric_limits<uint64_t>::max()});
}

TEST(permission_evaluator, weekday_names_start_on_sunday) {
  EXPECT_EQ(agentid::execution::weekday_name(0), "sunday");
  EXPECT_EQ(agentid::execution::weekday_name(1), "monday");
  EXPECT_EQ(agentid::execution::weekday_name(6), "saturday");
}
