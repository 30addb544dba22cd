#pragma once
#include <agentid/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>

// Schema type: policy change type recorded with each policy version.
namespace agentid::schema {

enum class policy_change_type_t : uint8_t {
  created = 0,
  updated = 1,
  activated = 2,
  deactivated = 3
};

inline constexpr auto kPolicyChangeTypeNames =
    std::array<std::pair<std::string_view, policy_change_type_t>, 4>{{
        {"created", policy_change_type_t::created},
        {"updated", policy_change_type_t::updated},
        {"activated", policy_change_type_t::activated},
        {"deactivated", policy_change_type_t::deactivated},
    }};

inline std::string_view to_string(const policy_change_type_t value) {
  return to_string(value, kPolicyChangeTypeNames).value_or("unknown");
}

}  // namespace agentid::schema
