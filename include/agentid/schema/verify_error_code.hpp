#pragma once
#include <agentid/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>

// Schema type: verification error code.
// Wire names are the upper-case identifiers relying parties match on.
namespace agentid::schema {

enum class verify_error_code : uint32_t {
  invalid_request = 1,
  missing_input = 2,
  credential_not_found = 3,
  credential_revoked = 4,
  credential_expired = 5,
  credential_not_yet_valid = 6,
  invalid_signature = 7,
  issuer_not_found = 8,
  internal_error = 9,
};

inline constexpr auto kVerifyErrorCodeNames =
    std::array<std::pair<std::string_view, verify_error_code>, 9>{{
        {"INVALID_REQUEST", verify_error_code::invalid_request},
        {"MISSING_INPUT", verify_error_code::missing_input},
        {"CREDENTIAL_NOT_FOUND", verify_error_code::credential_not_found},
        {"CREDENTIAL_REVOKED", verify_error_code::credential_revoked},
        {"CREDENTIAL_EXPIRED", verify_error_code::credential_expired},
        {"CREDENTIAL_NOT_YET_VALID",
         verify_error_code::credential_not_yet_valid},
        {"INVALID_SIGNATURE", verify_error_code::invalid_signature},
        {"ISSUER_NOT_FOUND", verify_error_code::issuer_not_found},
        {"INTERNAL_ERROR", verify_error_code::internal_error},
    }};

inline std::string_view to_string(const verify_error_code value) {
  return to_string(value, kVerifyErrorCodeNames).value_or("INTERNAL_ERROR");
}

}  // namespace agentid::schema
