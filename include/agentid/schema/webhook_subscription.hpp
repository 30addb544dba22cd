#pragma once

#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentid::schema {

template <uint16_t Version>
struct webhook_subscription;

template <>
struct webhook_subscription<1> final {
  uint16_t version{1};
  std::string subscription_id;
  std::string issuer_id;
  std::string url;
  std::string secret;
  std::vector<std::string> events;
  bool is_active{true};
  uint32_t consecutive_failures{};
  std::optional<timestamp_milliseconds_t> last_success_at;
  std::optional<timestamp_milliseconds_t> last_failure_at;
  timestamp_milliseconds_t created_at{};
};

using webhook_subscription_t = webhook_subscription<1>;

}  // namespace agentid::schema
