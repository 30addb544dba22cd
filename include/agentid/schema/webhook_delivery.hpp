#pragma once

#include <agentid/schema/delivery_status.hpp>
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct webhook_delivery;

template <>
struct webhook_delivery<1> final {
  uint16_t version{1};
  std::string delivery_id;
  std::string subscription_id;
  std::string event;
  std::string payload;
  delivery_status_t status{delivery_status_t::pending};
  uint32_t attempts{};
  std::optional<uint32_t> response_status;
  std::optional<timestamp_milliseconds_t> next_retry_at;
  std::string error;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using webhook_delivery_t = webhook_delivery<1>;

}  // namespace agentid::schema
