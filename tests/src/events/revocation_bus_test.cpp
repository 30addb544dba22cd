#include <agentid/events/revocation_bus.hpp>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

TEST(revocation_bus, publishes_to_every_subscriber) {
  auto bus = agentid::events::revocation_bus{};
  auto seen_a = std::vector<std::string>{};
  auto seen_b = std::vector<std::string>{};
  bus.subscribe([&](const auto& event) { seen_a.push_back(event.credential_id); });
  bus.subscribe([&](const auto& event) { seen_b.push_back(event.credential_id); });

  auto reached = bus.publish(agentid::schema::revocation_event_t{
      .sequence = 1, .credential_id = "c-1"});
  EXPECT_EQ(reached, 2u);
  EXPECT_EQ(seen_a, std::vector<std::string>{"c-1"});
  EXPECT_EQ(seen_b, std::vector<std::string>{"c-1"});
}

TEST(revocation_bus, unsubscribed_handlers_stop_hearing) {
  auto bus = agentid::events::revocation_bus{};
  auto count = 0;
  auto id = bus.subscribe([&](const auto&) { ++count; });
  EXPECT_EQ(bus.subscriber_count(), 1u);
  bus.publish({});
  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriber_count(), 0u);
  EXPECT_EQ(bus.publish({}), 0u);
  EXPECT_EQ(count, 1);
}

TEST(revocation_bus, throwing_subscriber_does_not_stop_fan_out) {
  auto bus = agentid::events::revocation_bus{};
  auto delivered = false;
  bus.subscribe([](const auto&) { throw std::runtime_error{"boom"}; });
  bus.subscribe([&](const auto&) { delivered = true; });
  EXPECT_EQ(bus.publish({}), 1u);
  EXPECT_TRUE(delivered);
}
