#pragma once

#include <agentid/schema/audit_entry.hpp>
#include <agentid/schema/authorization_grant.hpp>
#include <agentid/schema/credential_record.hpp>
#include <agentid/schema/issuer_record.hpp>
#include <agentid/schema/policy_record.hpp>
#include <agentid/schema/policy_version_record.hpp>
#include <agentid/schema/reputation_record.hpp>
#include <agentid/schema/trust_score_change.hpp>
#include <agentid/schema/revocation_event.hpp>
#include <agentid/schema/verification_event.hpp>
#include <agentid/schema/webhook_delivery.hpp>
#include <agentid/schema/webhook_subscription.hpp>
#include <agentid/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::storage {

enum class revoke_state : uint8_t { revoked, not_found, already_revoked };

struct revoke_outcome final {
  revoke_state state{revoke_state::not_found};
  std::optional<agentid::schema::credential_record_t> credential;
  std::optional<agentid::schema::revocation_event_t> event;
};

enum class modify_state : uint8_t { modified, not_found, rejected, conflict };

struct modify_outcome final {
  modify_state state{modify_state::not_found};
  std::optional<agentid::schema::credential_record_t> before;
  std::optional<agentid::schema::credential_record_t> after;
};

/// Edits a credential in place. Returning false abandons the change.
using credential_mutator_t =
    std::function<bool(agentid::schema::credential_record_t&)>;

struct revocation_query final {
  agentid::schema::timestamp_milliseconds_t since{};
  std::vector<std::string> credential_ids;
  std::size_t limit{100};
};

/// Typed persistence over the key/value backend.
///
/// Multi-row changes (credential + indexes, revoke + stream entry, policy +
/// version + name index, policy deletion) are committed as one batch. The
/// repository lock serialises check-then-write sections such as the active
/// (issuer, agent_id) uniqueness check and sequence allocation; reads do not
/// take it.
class repository final {
 public:
  explicit repository(rocksdb_storage_t& storage);

  void put_issuer(const agentid::schema::issuer_record_t& issuer);
  std::optional<agentid::schema::issuer_record_t> get_issuer(
      std::string_view issuer_id) const;
  std::vector<agentid::schema::issuer_record_t> list_issuers() const;

  std::optional<agentid::schema::credential_record_t> get_credential(
      std::string_view credential_id) const;

  /// Id of the active credential for (issuer, agent_id), if any.
  std::optional<std::string> find_active_credential(
      std::string_view issuer_id,
      std::string_view agent_id) const;

  /// Persist a new credential with its indexes. Returns false, writing
  /// nothing, when the record is active and another active credential
  /// already exists for the same (issuer, agent_id).
  bool insert_credential(const agentid::schema::credential_record_t& record);

  /// Replace a stored credential and reconcile its indexes. Returns false,
  /// writing nothing, when the update would make a second active credential
  /// for the same (issuer, agent_id).
  bool update_credential(const agentid::schema::credential_record_t& record);

  /// Read, mutate and write back one credential under the repository lock,
  /// so concurrent edits of the same credential cannot overwrite each other.
  /// `conflict` means the edit would create a second active credential for
  /// the same (issuer, agent_id).
  modify_outcome modify_credential(std::string_view credential_id,
                                   const credential_mutator_t& mutate);

  std::vector<agentid::schema::credential_record_t> list_credentials() const;
  std::vector<agentid::schema::credential_record_t> list_credentials_by_issuer(
      std::string_view issuer_id) const;
  std::vector<agentid::schema::credential_record_t> list_credentials_by_policy(
      std::string_view policy_id) const;

  /// Flip status to revoked, record reason and time, and append the
  /// revocation stream entry, all in one batch.
  revoke_outcome revoke_credential(std::string_view credential_id,
                                   std::string_view reason,
                                   agentid::schema::timestamp_milliseconds_t at,
                                   std::string revocation_id);

  /// Revocation stream entries with revoked_at > since, oldest first.
  std::vector<agentid::schema::revocation_event_t> list_revocations(
      const revocation_query& query) const;

  std::optional<agentid::schema::policy_record_t> get_policy(
      std::string_view policy_id) const;
  std::optional<agentid::schema::policy_record_t> find_policy_by_name(
      std::string_view issuer_id,
      std::string_view name) const;
  std::vector<agentid::schema::policy_record_t> list_policies(
      std::string_view issuer_id) const;

  /// Persist a policy, its version snapshot and its name index together.
  /// `previous_name` drops the old name index entry on rename.
  void save_policy(const agentid::schema::policy_record_t& policy,
                   const agentid::schema::policy_version_record_t& snapshot,
                   std::optional<std::string> previous_name = std::nullopt);

  /// Version history, oldest first.
  std::vector<agentid::schema::policy_version_record_t> list_policy_versions(
      std::string_view policy_id) const;

  /// Remove a policy with its history and detach every referencing
  /// credential. Returns the credentials as they were before detaching.
  std::vector<agentid::schema::credential_record_t> delete_policy(
      std::string_view policy_id,
      agentid::schema::timestamp_milliseconds_t at);

  std::optional<agentid::schema::reputation_record_t> get_reputation(
      std::string_view credential_id) const;
  void put_reputation(const agentid::schema::reputation_record_t& record);
  /// Store the reputation row together with a history entry; the entry gets
  /// a freshly allocated change id.
  agentid::schema::trust_score_change_t put_reputation(
      const agentid::schema::reputation_record_t& record,
      agentid::schema::trust_score_change_t change);
  /// Oldest first.
  std::vector<agentid::schema::trust_score_change_t> list_trust_history(
      std::string_view credential_id) const;
  std::vector<agentid::schema::reputation_record_t> list_reputations() const;

  void put_grant(const agentid::schema::authorization_grant_t& grant);
  std::optional<agentid::schema::authorization_grant_t> get_grant(
      std::string_view grant_id) const;
  std::vector<agentid::schema::authorization_grant_t> list_grants(
      std::string_view requester_credential_id,
      std::string_view grantor_credential_id) const;
  std::vector<agentid::schema::authorization_grant_t> list_grants() const;

  /// Append with a freshly allocated event id; returns the stored event.
  agentid::schema::verification_event_t append_verification_event(
      agentid::schema::verification_event_t event);
  std::vector<agentid::schema::verification_event_t> list_verification_events(
      std::optional<std::string> credential_id = std::nullopt) const;

  agentid::schema::audit_entry_t append_audit_entry(
      agentid::schema::audit_entry_t entry);
  std::vector<agentid::schema::audit_entry_t> list_audit_entries(
      std::optional<std::string> issuer_id = std::nullopt) const;

  void put_subscription(
      const agentid::schema::webhook_subscription_t& subscription);
  std::optional<agentid::schema::webhook_subscription_t> get_subscription(
      std::string_view subscription_id) const;
  std::vector<agentid::schema::webhook_subscription_t> list_subscriptions(
      std::string_view issuer_id) const;

  void put_delivery(const agentid::schema::webhook_delivery_t& delivery);
  std::optional<agentid::schema::webhook_delivery_t> get_delivery(
      std::string_view delivery_id) const;
  std::vector<agentid::schema::webhook_delivery_t> list_deliveries() const;

 private:
  uint64_t next_sequence(std::string_view name, write_batch& batch) const;
  void stage_credential(write_batch& batch,
                        const agentid::schema::credential_record_t& record,
                        const agentid::schema::credential_record_t* previous)
      const;
  bool conflicts_with_active(
      const agentid::schema::credential_record_t& record) const;

  mutable std::mutex mutex_;
  rocksdb_storage_t& storage_;
};

}  // namespace agentid::storage
