#pragma once

#include <agentid/common/time.hpp>
#include <agentid/crypto/signer.hpp>
#include <agentid/events/revocation_bus.hpp>
#include <agentid/execution/side_effects.hpp>
#include <agentid/schema/credential_record.hpp>
#include <agentid/schema/json.hpp>
#include <agentid/schema/operation_result.hpp>
#include <agentid/schema/revocation_event.hpp>
#include <agentid/storage/repository.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::execution {

inline constexpr auto kDefaultExtendDays = int64_t{90};
inline constexpr auto kMinExtendDays = int64_t{1};
inline constexpr auto kMaxExtendDays = int64_t{365};
inline constexpr auto kMaxBulkCredentials = std::size_t{100};
inline constexpr auto kDefaultRevocationReason =
    std::string_view{"Revoked by issuer"};
inline constexpr auto kBulkRevocationReason = std::string_view{"Bulk revocation"};

struct issue_request final {
  std::string issuer_id;
  std::string agent_id;
  std::string agent_name;
  std::string agent_type;
  agentid::schema::json_t permissions = agentid::schema::json_t::array();
  // Defaults to the issue time.
  std::optional<agentid::schema::timestamp_milliseconds_t> valid_from;
  agentid::schema::timestamp_milliseconds_t valid_until{};
  std::vector<std::string> geographic_restrictions;
  std::vector<std::string> allowed_services;
  agentid::schema::json_t metadata = agentid::schema::json_t::object();
  std::optional<std::string> policy_id;
};

struct issued_credential final {
  agentid::schema::credential_record_t record;
  // Signed wire payload, signature included.
  agentid::schema::json_t payload;
};

enum class bulk_action : uint8_t { revoke, renew };

std::optional<bulk_action> try_parse_bulk_action(std::string_view value);

struct bulk_request final {
  std::string issuer_id;
  std::string action;
  std::vector<std::string> credential_ids;
  std::optional<std::string> reason;
  std::optional<int64_t> extend_days;
};

struct bulk_item_result final {
  std::string credential_id;
  bool success{};
  std::optional<std::string> error;
};

struct bulk_outcome final {
  bulk_action action{bulk_action::revoke};
  std::vector<bulk_item_result> results;
  std::size_t total{};
  std::size_t successful{};
  std::size_t failed{};
};

/// Issue, renew, revoke, suspend and reinstate credentials.
///
/// State machine:
///   active -> revoked | expired | suspended
///   suspended -> active | revoked
///   expired -> active (renew) | revoked
///   revoked is terminal.
/// At most one active credential exists per (issuer, agent_id).
class credential_lifecycle final {
 public:
  /// `signer` may be null in verify-only processes; issue and renew then
  /// fail with signing_unavailable.
  credential_lifecycle(agentid::storage::repository& repository,
                       const agentid::crypto::signer* signer,
                       agentid::events::revocation_bus& bus,
                       side_effects& effects,
                       agentid::common::clock_fn_t clock);

  agentid::schema::operation_result<issued_credential> issue(
      const issue_request& request);

  /// Extend validity to max(valid_until, now) + extend_days and re-sign.
  /// The credential id is kept; the signature changes.
  agentid::schema::operation_result<agentid::schema::credential_record_t>
  renew(std::string_view issuer_id,
        std::string_view credential_id,
        std::optional<int64_t> extend_days = std::nullopt);

  /// Revoke, append to the revocation stream and notify live subscribers
  /// before returning.
  agentid::schema::operation_result<agentid::schema::revocation_event_t>
  revoke(std::string_view issuer_id,
         std::string_view credential_id,
         std::optional<std::string> reason = std::nullopt);

  agentid::schema::operation_result<agentid::schema::credential_record_t>
  suspend(std::string_view issuer_id, std::string_view credential_id);

  agentid::schema::operation_result<agentid::schema::credential_record_t>
  reinstate(std::string_view issuer_id, std::string_view credential_id);

  /// Apply revoke or renew to up to 100 credentials, reporting each one.
  agentid::schema::operation_result<bulk_outcome> bulk(
      const bulk_request& request);

  /// Flip active credentials whose validity has ended to expired. Returns
  /// how many changed.
  std::size_t mark_expired();

  std::optional<agentid::schema::credential_record_t> get(
      std::string_view credential_id) const;
  std::vector<agentid::schema::credential_record_t> list(
      std::string_view issuer_id) const;

 private:
  agentid::schema::operation_result<agentid::schema::credential_record_t>
  transition(std::string_view issuer_id,
             std::string_view credential_id,
             agentid::schema::credential_status_t from,
             agentid::schema::credential_status_t to);

  /// Rewrite the stored payload's valid_until from `record` and re-sign it,
  /// updating signature and credential_payload in place.
  void resign(agentid::schema::credential_record_t& record) const;

  agentid::storage::repository& repository_;
  const agentid::crypto::signer* signer_;
  agentid::events::revocation_bus& bus_;
  side_effects& effects_;
  agentid::common::clock_fn_t clock_;
};

}  // namespace agentid::execution
