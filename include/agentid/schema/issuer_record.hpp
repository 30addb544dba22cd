#pragma once

#include <agentid/schema/issuer_type.hpp>
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct issuer_record;

/// Registered issuer. The public key is derived once at registration and is
/// never stored alongside private material.
template <>
struct issuer_record<1> final {
  uint16_t version{1};
  std::string issuer_id;
  std::string name;
  issuer_type_t issuer_type{issuer_type_t::individual};
  bool verified{};
  std::string public_key;
  std::string key_id;
  timestamp_milliseconds_t created_at{};
};

using issuer_record_t = issuer_record<1>;

}  // namespace agentid::schema
