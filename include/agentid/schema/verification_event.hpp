#pragma once

#include <agentid/schema/primitives.hpp>
#include <agentid/schema/verify_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct verification_event;

template <>
struct verification_event<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  std::string request_id;
  std::optional<std::string> credential_id;
  std::optional<std::string> agent_id;
  std::optional<std::string> issuer_id;
  bool success{};
  std::optional<verify_error_code> error_code;
  std::string failure_reason;
  uint64_t latency_ms{};
  timestamp_milliseconds_t recorded_at{};
};

using verification_event_t = verification_event<1>;

}  // namespace agentid::schema
