#pragma once

#include <agentid/schema/json.hpp>
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace agentid::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  uint64_t entry_id{};
  std::string issuer_id;
  std::string action;
  std::string resource_type;
  std::string resource_id;
  json_t details = json_t::object();
  timestamp_milliseconds_t recorded_at{};
};

using audit_entry_t = audit_entry<1>;

}  // namespace agentid::schema
