#pragma once
#include <agentid/schema/enum_string.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: agent-to-agent authorization grant status.
namespace agentid::schema {

enum class grant_status_t : uint8_t {
  pending = 0,
  approved = 1,
  denied = 2,
  revoked = 3,
  expired = 4
};

inline constexpr auto kGrantStatusNames =
    std::array<std::pair<std::string_view, grant_status_t>, 5>{{
        {"pending", grant_status_t::pending},
        {"approved", grant_status_t::approved},
        {"denied", grant_status_t::denied},
        {"revoked", grant_status_t::revoked},
        {"expired", grant_status_t::expired},
    }};

inline std::string_view to_string(const grant_status_t value) {
  return to_string(value, kGrantStatusNames).value_or("unknown");
}

}  // namespace agentid::schema
