#include <agentid/events/side_effect_dispatcher.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

TEST(side_effect_dispatcher, runs_every_submitted_task) {
  auto dispatcher = agentid::events::side_effect_dispatcher{2};
  auto counter = std::atomic<int>{0};
  for (auto i = 0; i < 50; ++i) {
    EXPECT_TRUE(dispatcher.submit("count", [&] { ++counter; }));
  }
  dispatcher.wait_idle();
  EXPECT_EQ(counter.load(), 50);
}

TEST(side_effect_dispatcher, failing_task_is_counted_and_dropped) {
  auto dispatcher = agentid::events::side_effect_dispatcher{1};
  auto after = std::atomic<bool>{false};
  dispatcher.submit("explode", [] { throw std::runtime_error{"boom"}; });
  dispatcher.submit("after", [&] { after = true; });
  dispatcher.wait_idle();
  EXPECT_EQ(dispatcher.failed_tasks(), 1u);
  EXPECT_TRUE(after.load());
}

TEST(side_effect_dispatcher, stop_drains_and_refuses_new_work) {
  auto dispatcher = agentid::events::side_effect_dispatcher{1};
  auto counter = std::atomic<int>{0};
  for (auto i = 0; i < 10; ++i) {
    dispatcher.submit("count", [&] { ++counter; });
  }
  dispatcher.stop();
  EXPECT_EQ(counter.load(), 10);
  EXPECT_FALSE(dispatcher.submit("late", [&] { ++counter; }));
  EXPECT_EQ(counter.load(), 10);
}

TEST(side_effect_dispatcher, accepted_work_survives_a_racing_stop) {
  for (auto round = 0; round < 200; ++round) {
    auto dispatcher = agentid::events::side_effect_dispatcher{4};
    auto accepted = std::atomic<int>{0};
    auto ran = std::atomic<int>{0};
    auto producer = std::thread{[&] {
      for (auto i = 0; i < 100; ++i) {
        if (dispatcher.submit("count", [&] { ++ran; })) {
          ++accepted;
        }
      }
    }};
    dispatcher.stop();
    producer.join();
    EXPECT_EQ(ran.load(), accepted.load());
  }
}
