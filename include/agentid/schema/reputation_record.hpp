#pragma once

#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct reputation_record;

/// Per-credential verification counters and the scores derived from them.
/// Scores are whole numbers in 0..100.
template <>
struct reputation_record<1> final {
  uint16_t version{1};
  std::string credential_id;
  std::string agent_id;
  std::string issuer_id;
  uint32_t trust_score{};
  uint32_t verification_score{};
  uint32_t longevity_score{};
  uint32_t activity_score{};
  uint64_t total_verifications{};
  uint64_t successful_verifications{};
  uint64_t failed_verifications{};
  std::optional<timestamp_milliseconds_t> last_verification_at;
  timestamp_milliseconds_t updated_at{};
};

using reputation_record_t = reputation_record<1>;

}  // namespace agentid::schema
