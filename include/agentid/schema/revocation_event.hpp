#pragma once

#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct revocation_event;

/// Entry in the ordered revocation stream. `sequence` is assigned in commit
/// order and never reused.
template <>
struct revocation_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::string revocation_id;
  std::string credential_id;
  std::string issuer_id;
  std::string agent_id;
  std::string reason;
  timestamp_milliseconds_t revoked_at{};
};

using revocation_event_t = revocation_event<1>;

}  // namespace agentid::schema
