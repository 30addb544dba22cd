#include <agentid/events/revocation_bus.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <vector>

namespace agentid::events {

revocation_bus::subscription_id_t revocation_bus::subscribe(
    revocation_handler_t handler) {
  auto lock = std::scoped_lock{mutex_};
  auto id = next_id_++;
  subscribers_.emplace(id, std::move(handler));
  return id;
}

void revocation_bus::unsubscribe(subscription_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  subscribers_.erase(id);
}

std::size_t revocation_bus::publish(
    const agentid::schema::revocation_event_t& event) {
  auto handlers = std::vector<std::pair<subscription_id_t, revocation_handler_t>>{};
  {
    auto lock = std::scoped_lock{mutex_};
    handlers.assign(std::begin(subscribers_), std::end(subscribers_));
  }

  auto delivered = std::size_t{0};
  for (const auto& [id, handler] : handlers) {
    try {
      handler(event);
      ++delivered;
    } catch (const std::exception& e) {
      spdlog::warn("Revocation subscriber {} failed for credential '{}': {}",
                   id, event.credential_id, e.what());
    }
  }
  spdlog::debug("Broadcast revocation {} of '{}' to {} subscriber(s)",
                event.sequence, event.credential_id, delivered);
  return delivered;
}

std::size_t revocation_bus::subscriber_count() const {
  auto lock = std::scoped_lock{mutex_};
  return subscribers_.size();
}

}  // namespace agentid::events
