#pragma once

#include <cstdint>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct issuer_reputation;

template <>
struct issuer_reputation<1> final {
  uint16_t version{1};
  std::string issuer_id;
  uint32_t trust_score{};
  uint64_t total_credentials{};
  uint64_t active_credentials{};
  uint64_t revoked_credentials{};
  uint64_t expired_credentials{};
  uint64_t total_verifications{};
  uint64_t successful_verifications{};
};

using issuer_reputation_t = issuer_reputation<1>;

}  // namespace agentid::schema
