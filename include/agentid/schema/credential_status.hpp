#pragma once
#include <agentid/schema/enum_string.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: credential status.
// Lifecycle: active credentials may be suspended, renewed or revoked;
// revoked is terminal. Expiry is derived from the clock and only stored
// when the expiry sweep materialises it.
namespace agentid::schema {

enum class credential_status_t : uint8_t {
  active = 0,
  revoked = 1,
  expired = 2,
  suspended = 3
};

inline constexpr auto kCredentialStatusNames =
    std::array<std::pair<std::string_view, credential_status_t>, 4>{{
        {"active", credential_status_t::active},
        {"revoked", credential_status_t::revoked},
        {"expired", credential_status_t::expired},
        {"suspended", credential_status_t::suspended},
    }};

inline std::string_view to_string(const credential_status_t value) {
  return to_string(value, kCredentialStatusNames).value_or("unknown");
}

inline std::optional<credential_status_t> try_parse_credential_status(
    const std::string_view value) {
  return from_string(value, kCredentialStatusNames);
}

}  // namespace agentid::schema
