#include <agentid/events/side_effect_dispatcher.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace agentid::events {

side_effect_dispatcher::side_effect_dispatcher(std::size_t worker_count) {
  if (worker_count == 0) {
    worker_count = 1;
  }
  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
}

side_effect_dispatcher::~side_effect_dispatcher() { stop(); }

bool side_effect_dispatcher::submit(std::string name, task_t fn) {
  {
    auto lock = std::scoped_lock{queue_mutex_};
    if (stopping_) {
      spdlog::warn("Dropping side effect '{}': dispatcher is stopping", name);
      return false;
    }
    queue_.push_back(task{std::move(name), std::move(fn)});
  }
  queue_cv_.notify_one();
  return true;
}

void side_effect_dispatcher::wait_idle() {
  auto lock = std::unique_lock{queue_mutex_};
  idle_cv_.wait(lock, [this]() { return queue_.empty() && running_ == 0; });
}

void side_effect_dispatcher::stop() {
  {
    auto lock = std::scoped_lock{queue_mutex_};
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  queue_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void side_effect_dispatcher::worker_loop() {
  while (true) {
    auto next = task{};
    {
      auto lock = std::unique_lock{queue_mutex_};
      queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) {
        return;
      }
      next = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }

    try {
      next.fn();
    } catch (const std::exception& e) {
      ++failed_;
      spdlog::warn("Side effect '{}' failed: {}", next.name, e.what());
    }

    {
      auto lock = std::scoped_lock{queue_mutex_};
      --running_;
    }
    idle_cv_.notify_all();
  }
}

}  // namespace agentid::events
