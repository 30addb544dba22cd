#pragma once
#include <agentid/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>

namespace agentid::schema {

/// Outcome codes for mutating operations (issue, renew, revoke, policy and
/// grant management). `ok` is zero so results can be tested like a status.
enum class operation_error_code : uint32_t {
  ok = 0,
  invalid_request = 1,
  issuer_not_found = 2,
  credential_not_found = 3,
  policy_not_found = 4,
  grant_not_found = 5,
  subscription_not_found = 6,
  duplicate_active_credential = 10,
  credential_revoked = 11,
  already_revoked = 12,
  invalid_extend_days = 13,
  invalid_transition = 14,
  issuer_mismatch = 15,
  batch_empty = 20,
  batch_too_large = 21,
  signing_unavailable = 30,
  internal_error = 31,
};

inline constexpr auto kOperationErrorCodeNames =
    std::array<std::pair<std::string_view, operation_error_code>, 17>{{
        {"ok", operation_error_code::ok},
        {"invalid_request", operation_error_code::invalid_request},
        {"issuer_not_found", operation_error_code::issuer_not_found},
        {"credential_not_found", operation_error_code::credential_not_found},
        {"policy_not_found", operation_error_code::policy_not_found},
        {"grant_not_found", operation_error_code::grant_not_found},
        {"subscription_not_found",
         operation_error_code::subscription_not_found},
        {"duplicate_active_credential",
         operation_error_code::duplicate_active_credential},
        {"credential_revoked", operation_error_code::credential_revoked},
        {"already_revoked", operation_error_code::already_revoked},
        {"invalid_extend_days", operation_error_code::invalid_extend_days},
        {"invalid_transition", operation_error_code::invalid_transition},
        {"issuer_mismatch", operation_error_code::issuer_mismatch},
        {"batch_empty", operation_error_code::batch_empty},
        {"batch_too_large", operation_error_code::batch_too_large},
        {"signing_unavailable", operation_error_code::signing_unavailable},
        {"internal_error", operation_error_code::internal_error},
    }};

inline std::string_view to_string(const operation_error_code value) {
  return to_string(value, kOperationErrorCodeNames).value_or("internal_error");
}

}  // namespace agentid::schema
