#pragma once

#include <agentid/schema/revocation_event.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace agentid::events {

using revocation_handler_t =
    std::function<void(const agentid::schema::revocation_event_t&)>;

/// In-process publish/subscribe channel for revocations. Publishing happens
/// after the revocation is committed, so a subscriber never hears about a
/// revocation that storage does not have. Polling the revocation stream
/// remains the catch-up path for consumers that were not subscribed.
class revocation_bus final {
 public:
  using subscription_id_t = uint64_t;

  subscription_id_t subscribe(revocation_handler_t handler);
  void unsubscribe(subscription_id_t id);

  /// Deliver to every current subscriber and return how many were reached.
  /// A throwing subscriber is logged and does not stop the fan-out.
  std::size_t publish(const agentid::schema::revocation_event_t& event);

  std::size_t subscriber_count() const;

 private:
  mutable std::mutex mutex_;
  std::map<subscription_id_t, revocation_handler_t> subscribers_;
  subscription_id_t next_id_{1};
};

}  // namespace agentid::events
