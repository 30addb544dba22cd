#pragma once

#include <agentid/schema/json.hpp>
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct policy_record;

/// Named permission set shared by reference between credentials.
template <>
struct policy_record<1> final {
  uint16_t version{1};
  std::string policy_id;
  std::string issuer_id;
  std::string name;
  std::string description;
  json_t permissions = json_t::array();
  uint32_t policy_version{1};
  bool is_active{true};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using policy_record_t = policy_record<1>;

}  // namespace agentid::schema
