#pragma once

#include <agentid/schema/credential_record.hpp>
#include <agentid/schema/issuer_record.hpp>
#include <agentid/schema/json.hpp>
#include <optional>
#include <string>

namespace agentid::execution {

/// Unsigned wire payload of a credential:
/// {credential_id, agent_id, agent_name, agent_type, issuer{issuer_id,
/// issuer_type, issuer_verified, name}, permissions, constraints{valid_from,
/// valid_until, geographic_restrictions, allowed_services}, issued_at}.
agentid::schema::json_t make_credential_payload(
    const agentid::schema::credential_record_t& credential,
    const agentid::schema::issuer_record_t& issuer);

/// Fields a verifier needs from a presented payload.
struct presented_credential final {
  std::string credential_id;
  std::string issuer_id;
  std::string agent_id;
  std::string agent_name;
  std::string agent_type;
  agentid::schema::json_t permissions = agentid::schema::json_t::array();
  agentid::schema::timestamp_milliseconds_t valid_from{};
  agentid::schema::timestamp_milliseconds_t valid_until{};
  std::string signature;
};

/// Structural parse of a presented payload. Empty when a required member is
/// missing or has the wrong type, or a timestamp does not parse.
std::optional<presented_credential> parse_credential_payload(
    const agentid::schema::json_t& payload);

}  // namespace agentid::execution
