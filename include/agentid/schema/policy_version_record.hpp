#pragma once

#include <agentid/schema/json.hpp>
#include <agentid/schema/policy_change_type.hpp>
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct policy_version_record;

template <>
struct policy_version_record<1> final {
  uint16_t version{1};
  std::string policy_id;
  uint32_t policy_version{1};
  json_t permissions = json_t::array();
  policy_change_type_t change_type{policy_change_type_t::created};
  std::string change_reason;
  timestamp_milliseconds_t created_at{};
};

using policy_version_record_t = policy_version_record<1>;

}  // namespace agentid::schema
