#pragma once

#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct trust_score_change;

/// One entry of a credential's trust score history, written whenever the
/// trust score moves. `change_delta` is new minus previous score.
template <>
struct trust_score_change<1> final {
  uint16_t version{1};
  uint64_t change_id{};
  std::string credential_id;
  uint32_t trust_score{};
  uint32_t verification_score{};
  uint32_t longevity_score{};
  uint32_t activity_score{};
  uint32_t issuer_score{};
  std::string change_reason;
  int32_t change_delta{};
  timestamp_milliseconds_t recorded_at{};
};

using trust_score_change_t = trust_score_change<1>;

}  // namespace agentid::schema
