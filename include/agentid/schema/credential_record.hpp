#pragma once

#include <agentid/schema/credential_status.hpp>
#include <agentid/schema/json.hpp>
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentid::schema {

template <uint16_t Version>
struct credential_record;

template <>
struct credential_record<1> final {
  uint16_t version{1};
  std::string credential_id;
  std::string issuer_id;
  std::string agent_id;
  std::string agent_name;
  std::string agent_type;
  json_t permissions = json_t::array();
  std::optional<std::string> policy_id;
  timestamp_milliseconds_t valid_from{};
  timestamp_milliseconds_t valid_until{};
  std::vector<std::string> geographic_restrictions;
  std::vector<std::string> allowed_services;
  credential_status_t status{credential_status_t::active};
  std::string signature;
  std::string key_id;
  // Exact signed JSON text, including the signature field.
  std::string credential_payload;
  json_t metadata = json_t::object();
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  std::optional<timestamp_milliseconds_t> revoked_at;
  std::optional<std::string> revocation_reason;
};

using credential_record_t = credential_record<1>;

}  // namespace agentid::schema
