#pragma once
#include <agentid/schema/enum_string.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: issuer type.
namespace agentid::schema {

enum class issuer_type_t : uint8_t {
  individual = 0,
  organization = 1,
  enterprise = 2
};

inline constexpr auto kIssuerTypeNames =
    std::array<std::pair<std::string_view, issuer_type_t>, 3>{{
        {"individual", issuer_type_t::individual},
        {"organization", issuer_type_t::organization},
        {"enterprise", issuer_type_t::enterprise},
    }};

inline std::string_view to_string(const issuer_type_t value) {
  return to_string(value, kIssuerTypeNames).value_or("unknown");
}

inline std::optional<issuer_type_t> try_parse_issuer_type(
    const std::string_view value) {
  return from_string(value, kIssuerTypeNames);
}

}  // namespace agentid::schema
