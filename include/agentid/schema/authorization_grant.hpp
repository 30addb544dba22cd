#pragma once

#include <agentid/schema/grant_status.hpp>
#include <agentid/schema/json.hpp>
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct authorization_grant;

/// Permission grant from a grantor credential to a requester credential.
/// `permissions` is an array of {action, resource?, constraints?}.
template <>
struct authorization_grant<1> final {
  uint16_t version{1};
  std::string grant_id;
  std::string requester_credential_id;
  std::string grantor_credential_id;
  json_t permissions = json_t::array();
  json_t constraints = json_t::object();
  grant_status_t status{grant_status_t::pending};
  std::optional<timestamp_milliseconds_t> valid_until;
  std::string message;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  std::optional<timestamp_milliseconds_t> responded_at;
};

using authorization_grant_t = authorization_grant<1>;

}  // namespace agentid::schema
