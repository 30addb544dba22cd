#pragma once

#include <agentid/common/time.hpp>
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentid::execution {

struct rate_limit_decision final {
  bool allowed{};
  uint64_t remaining{};
  agentid::schema::timestamp_milliseconds_t reset_at{};
};

struct rate_limit_request final {
  std::string key;
  uint64_t limit{};
  agentid::schema::duration_milliseconds_t window{};
};

/// Fixed-window request counters held in process memory. A window opens on
/// the first request for a key and admits `limit` requests until it resets.
/// Counters are not shared between processes and do not survive a restart.
class rate_limiter final {
 public:
  explicit rate_limiter(agentid::common::clock_fn_t clock);

  rate_limit_decision consume(const std::string& key,
                              uint64_t limit,
                              agentid::schema::duration_milliseconds_t window);

  /// Check every window and charge all of them only when each one admits
  /// the request. Decisions come back in request order.
  std::vector<rate_limit_decision> consume_all(
      const std::vector<rate_limit_request>& requests);

  /// Drop windows that have already reset.
  std::size_t purge_expired();

 private:
  struct window_state final {
    uint64_t count{};
    agentid::schema::timestamp_milliseconds_t reset_at{};
  };

  window_state& current_window(const std::string& key,
                               agentid::schema::duration_milliseconds_t window,
                               agentid::schema::timestamp_milliseconds_t now);

  agentid::common::clock_fn_t clock_;
  std::mutex mutex_;
  std::unordered_map<std::string, window_state> windows_;
};

}  // namespace agentid::execution
