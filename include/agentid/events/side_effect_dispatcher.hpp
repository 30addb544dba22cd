#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace agentid::events {

/// Fire-and-forget executor for bookkeeping (verification log, reputation,
/// audit log, webhook fan-out). Submitting never blocks on the task; a task
/// that throws is logged and dropped.
class side_effect_dispatcher final {
 public:
  using task_t = std::function<void()>;

  explicit side_effect_dispatcher(std::size_t worker_count = 2);
  ~side_effect_dispatcher();

  side_effect_dispatcher(const side_effect_dispatcher&) = delete;
  side_effect_dispatcher& operator=(const side_effect_dispatcher&) = delete;

  /// Queue a named task. Returns false once the dispatcher is stopping.
  bool submit(std::string name, task_t task);

  /// Block until the queue is drained and no task is running.
  void wait_idle();

  /// Drain outstanding work and join the workers.
  void stop();

  std::size_t failed_tasks() const { return failed_.load(); }

 private:
  struct task final {
    std::string name;
    task_t fn;
  };

  void worker_loop();

  std::deque<task> queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::vector<std::thread> workers_;
  // Both guarded by queue_mutex_.
  std::size_t running_{0};
  bool stopping_{false};
  std::atomic<std::size_t> failed_{0};
};

}  // namespace agentid::events
