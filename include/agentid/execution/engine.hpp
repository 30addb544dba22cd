#pragma once

#include <agentid/common/time.hpp>
#include <agentid/crypto/signer.hpp>
#include <agentid/events/revocation_bus.hpp>
#include <agentid/events/side_effect_dispatcher.hpp>
#include <agentid/execution/authorization_checker.hpp>
#include <agentid/execution/credential_lifecycle.hpp>
#include <agentid/execution/issuer_registry.hpp>
#include <agentid/execution/policy_engine.hpp>
#include <agentid/execution/rate_limiter.hpp>
#include <agentid/execution/reputation.hpp>
#include <agentid/execution/side_effects.hpp>
#include <agentid/execution/verifier.hpp>
#include <agentid/schema/audit_entry.hpp>
#include <agentid/schema/operation_result.hpp>
#include <agentid/schema/revocation_event.hpp>
#include <agentid/schema/verification_event.hpp>
#include <agentid/storage/repository.hpp>
#include <agentid/webhooks/dispatcher.hpp>
#include <agentid/webhooks/transport.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::execution {

struct engine_options final {
  // Absent in verify-only processes.
  std::optional<agentid::crypto::master_secret> secret;
  // Null leaves webhook deliveries pending for an external sender.
  agentid::webhooks::webhook_transport* transport{};
  std::size_t worker_count{2};
};

struct sweep_summary final {
  std::size_t expired_credentials{};
  std::vector<std::string> expired_grants;
  std::size_t purged_rate_windows{};
};

/// Credential service facade used by the gRPC service and the tests.
///
/// The engine owns every component and wires them to one repository, one
/// clock and one side-effect dispatcher. Public operations never throw:
/// storage failures surface as internal_error results (or INTERNAL_ERROR for
/// verification) and are logged.
class engine final {
 public:
  engine(agentid::storage::repository& repository,
         engine_options options,
         agentid::common::clock_fn_t clock = agentid::common::system_clock());
  ~engine();

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// False in verify-only mode.
  bool can_sign() const;

  agentid::schema::operation_result<agentid::schema::issuer_record_t>
  register_issuer(const register_issuer_request& request);
  agentid::schema::operation_result<agentid::schema::issuer_record_t>
  set_issuer_verified(std::string_view issuer_id, bool verified);
  std::optional<agentid::schema::issuer_record_t> get_issuer(
      std::string_view issuer_id) const;

  agentid::schema::operation_result<issued_credential> issue_credential(
      const issue_request& request);
  agentid::schema::operation_result<agentid::schema::credential_record_t>
  renew_credential(std::string_view issuer_id,
                   std::string_view credential_id,
                   std::optional<int64_t> extend_days = std::nullopt);
  agentid::schema::operation_result<agentid::schema::revocation_event_t>
  revoke_credential(std::string_view issuer_id,
                    std::string_view credential_id,
                    std::optional<std::string> reason = std::nullopt);
  agentid::schema::operation_result<agentid::schema::credential_record_t>
  suspend_credential(std::string_view issuer_id,
                     std::string_view credential_id);
  agentid::schema::operation_result<agentid::schema::credential_record_t>
  reinstate_credential(std::string_view issuer_id,
                       std::string_view credential_id);
  agentid::schema::operation_result<bulk_outcome> bulk_credentials(
      const bulk_request& request);
  std::optional<agentid::schema::credential_record_t> get_credential(
      std::string_view credential_id) const;
  std::vector<agentid::schema::credential_record_t> list_credentials(
      std::string_view issuer_id) const;

  verification_response verify(const verify_request& request);
  agentid::schema::operation_result<std::vector<verification_response>>
  verify_batch(const std::vector<verify_request>& requests);

  agentid::schema::operation_result<upsert_policy_outcome> upsert_policy(
      const upsert_policy_request& request);
  agentid::schema::operation_result<update_policy_outcome> update_policy(
      const update_policy_request& request);
  agentid::schema::operation_result<std::size_t> assign_policy(
      std::string_view issuer_id,
      std::string_view credential_id,
      std::string_view policy_id);
  agentid::schema::operation_result<std::size_t> remove_policy(
      std::string_view issuer_id,
      std::string_view credential_id);
  agentid::schema::operation_result<std::size_t> delete_policy(
      std::string_view issuer_id,
      std::string_view policy_id);
  std::optional<policy_details> get_policy(
      std::string_view issuer_id,
      std::string_view policy_id,
      std::size_t version_limit = kDefaultPolicyVersionLimit) const;
  std::vector<agentid::schema::policy_record_t> list_policies(
      std::string_view issuer_id) const;

  agentid::schema::operation_result<agentid::schema::authorization_grant_t>
  request_authorization(const grant_request& request);
  agentid::schema::operation_result<agentid::schema::authorization_grant_t>
  respond_authorization(std::string_view issuer_id,
                        std::string_view grant_id,
                        bool approve);
  agentid::schema::operation_result<agentid::schema::authorization_grant_t>
  revoke_authorization(std::string_view issuer_id, std::string_view grant_id);
  authorization_decision check_authorization(const authorization_query& query);
  std::vector<agentid::schema::authorization_grant_t> list_authorizations(
      std::string_view credential_id) const;

  std::optional<agentid::schema::reputation_record_t> reputation(
      std::string_view credential_id) const;
  std::optional<agentid::schema::issuer_reputation_t> issuer_reputation(
      std::string_view issuer_id) const;
  std::vector<leaderboard_entry> leaderboard(std::size_t limit = 10) const;
  /// Trust score history of a credential. The limit is clamped to 1..500
  /// (default 100) and the period to 1..365 days (default 30).
  agentid::schema::operation_result<trust_history> reputation_history(
      std::string_view credential_id,
      std::optional<std::size_t> limit = std::nullopt,
      std::optional<uint32_t> days = std::nullopt) const;

  /// Poll the revocation stream; the cap is clamped to 1..1000.
  std::vector<agentid::schema::revocation_event_t> revocations(
      agentid::storage::revocation_query query) const;
  agentid::events::revocation_bus::subscription_id_t subscribe_revocations(
      agentid::events::revocation_handler_t handler);
  void unsubscribe_revocations(
      agentid::events::revocation_bus::subscription_id_t id);

  agentid::schema::operation_result<agentid::schema::webhook_subscription_t>
  create_webhook(std::string_view issuer_id,
                 std::string url,
                 std::vector<std::string> events);
  agentid::schema::operation_result<agentid::schema::webhook_subscription_t>
  set_webhook_active(std::string_view issuer_id,
                     std::string_view subscription_id,
                     bool active);
  std::vector<agentid::schema::webhook_subscription_t> list_webhooks(
      std::string_view issuer_id) const;

  std::vector<agentid::schema::audit_entry_t> audit_log(
      std::string_view issuer_id) const;
  std::vector<agentid::schema::verification_event_t> verification_log(
      std::optional<std::string> credential_id = std::nullopt) const;

  /// Materialise time-driven transitions: expired credentials, expired
  /// grants, stale rate-limit windows.
  sweep_summary sweep();

  /// Block until queued side effects have run.
  void wait_idle();

 private:
  agentid::storage::repository& repository_;
  agentid::common::clock_fn_t clock_;
  std::optional<agentid::crypto::signer> signer_;
  agentid::events::side_effect_dispatcher dispatcher_;
  agentid::events::revocation_bus bus_;
  rate_limiter limiter_;
  reputation_aggregator reputation_;
  agentid::webhooks::dispatcher webhooks_;
  side_effects effects_;
  issuer_registry issuers_;
  policy_engine policies_;
  credential_lifecycle lifecycle_;
  verifier verifier_;
  authorization_checker authorizations_;
};

}  // namespace agentid::execution
