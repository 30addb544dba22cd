#include <agentid/schema/encoding/scale/records.hpp>
#include <agentid/schema/key/builder.hpp>
#include <agentid/schema/key/keys.hpp>
#include <agentid/storage/repository.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentid::storage {

namespace {

namespace key = agentid::schema::key;
namespace codec = agentid::schema::encoding::scale;
using agentid::schema::bytes_t;
using agentid::schema::make_bytes;
using agentid::schema::make_bytes_view;

template <typename T>
std::optional<T> load(const rocksdb_storage_t& storage, const bytes_t& k) {
  auto raw = storage.get(make_bytes_view(k));
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = codec::decode<T>(make_bytes_view(*raw));
  if (!decoded) {
    spdlog::error("Stored record under '{}' failed to decode",
                  agentid::schema::make_string_view(k));
    throw storage_error{"corrupt record in storage"};
  }
  return decoded;
}

template <typename T>
std::vector<T> load_prefix(const rocksdb_storage_t& storage,
                           const bytes_t& prefix) {
  auto out = std::vector<T>{};
  for (const auto& [k, value] : storage.list_by_prefix(make_bytes_view(prefix))) {
    auto decoded = codec::decode<T>(make_bytes_view(value));
    if (!decoded) {
      spdlog::error("Stored record under '{}' failed to decode",
                    agentid::schema::make_string_view(k));
      throw storage_error{"corrupt record in storage"};
    }
    out.push_back(std::move(*decoded));
  }
  return out;
}

/// Follow index rows under prefix to the credentials they name.
std::vector<agentid::schema::credential_record_t> load_indexed_credentials(
    const rocksdb_storage_t& storage,
    const bytes_t& prefix) {
  auto out = std::vector<agentid::schema::credential_record_t>{};
  for (const auto& [k, _] : storage.list_by_prefix(make_bytes_view(prefix))) {
    auto credential_id = key::index_tail(make_bytes_view(k));
    auto credential = load<agentid::schema::credential_record_t>(
        storage, key::make_credential_key(credential_id));
    if (credential) {
      out.push_back(std::move(*credential));
    }
  }
  return out;
}

}  // namespace

repository::repository(rocksdb_storage_t& storage) : storage_{storage} {}

void repository::put_issuer(const agentid::schema::issuer_record_t& issuer) {
  auto encoded = codec::encode(issuer);
  storage_.put(make_bytes_view(key::make_issuer_key(issuer.issuer_id)),
               make_bytes_view(encoded));
}

std::optional<agentid::schema::issuer_record_t> repository::get_issuer(
    std::string_view issuer_id) const {
  return load<agentid::schema::issuer_record_t>(storage_,
                                                key::make_issuer_key(issuer_id));
}

std::vector<agentid::schema::issuer_record_t> repository::list_issuers()
    const {
  return load_prefix<agentid::schema::issuer_record_t>(
      storage_, key::make_prefix(key::kIssuerPrefix));
}

std::optional<agentid::schema::credential_record_t> repository::get_credential(
    std::string_view credential_id) const {
  return load<agentid::schema::credential_record_t>(
      storage_, key::make_credential_key(credential_id));
}

std::optional<std::string> repository::find_active_credential(
    std::string_view issuer_id,
    std::string_view agent_id) const {
  auto raw =
      storage_.get(make_bytes_view(key::make_active_agent_key(issuer_id, agent_id)));
  if (!raw) {
    return std::nullopt;
  }
  return agentid::schema::make_string(*raw);
}

bool repository::conflicts_with_active(
    const agentid::schema::credential_record_t& record) const {
  if (record.status != agentid::schema::credential_status_t::active) {
    return false;
  }
  auto existing = find_active_credential(record.issuer_id, record.agent_id);
  return existing.has_value() && *existing != record.credential_id;
}

void repository::stage_credential(
    write_batch& batch,
    const agentid::schema::credential_record_t& record,
    const agentid::schema::credential_record_t* previous) const {
  batch.put(key::make_credential_key(record.credential_id),
            codec::encode(record));
  batch.put(key::make_issuer_credential_key(record.issuer_id,
                                            record.credential_id),
            make_bytes(record.credential_id));

  if (previous != nullptr && previous->policy_id &&
      previous->policy_id != record.policy_id) {
    batch.remove(key::make_policy_credential_key(*previous->policy_id,
                                                 record.credential_id));
  }
  if (record.policy_id) {
    batch.put(key::make_policy_credential_key(*record.policy_id,
                                              record.credential_id),
              make_bytes(record.credential_id));
  }

  auto active_key = key::make_active_agent_key(record.issuer_id, record.agent_id);
  if (record.status == agentid::schema::credential_status_t::active) {
    batch.put(active_key, make_bytes(record.credential_id));
  } else {
    auto indexed = find_active_credential(record.issuer_id, record.agent_id);
    if (indexed && *indexed == record.credential_id) {
      batch.remove(active_key);
    }
  }
}

bool repository::insert_credential(
    const agentid::schema::credential_record_t& record) {
  auto lock = std::scoped_lock{mutex_};
  if (conflicts_with_active(record)) {
    return false;
  }
  auto batch = write_batch{};
  stage_credential(batch, record, nullptr);
  storage_.commit(batch);
  return true;
}

bool repository::update_credential(
    const agentid::schema::credential_record_t& record) {
  auto lock = std::scoped_lock{mutex_};
  if (conflicts_with_active(record)) {
    return false;
  }
  auto previous = get_credential(record.credential_id);
  auto batch = write_batch{};
  stage_credential(batch, record, previous ? &*previous : nullptr);
  storage_.commit(batch);
  return true;
}

modify_outcome repository::modify_credential(
    std::string_view credential_id,
    const credential_mutator_t& mutate) {
  auto lock = std::scoped_lock{mutex_};
  auto previous = get_credential(credential_id);
  if (!previous) {
    return modify_outcome{.state = modify_state::not_found};
  }
  auto updated = *previous;
  if (!mutate(updated)) {
    return modify_outcome{.state = modify_state::rejected,
                          .before = std::move(previous)};
  }
  if (conflicts_with_active(updated)) {
    return modify_outcome{.state = modify_state::conflict,
                          .before = std::move(previous)};
  }
  auto batch = write_batch{};
  stage_credential(batch, updated, &*previous);
  storage_.commit(batch);
  return modify_outcome{.state = modify_state::modified,
                        .before = std::move(previous),
                        .after = std::move(updated)};
}

std::vector<agentid::schema::credential_record_t>
repository::list_credentials() const {
  return load_prefix<agentid::schema::credential_record_t>(
      storage_, key::make_prefix(key::kCredentialPrefix));
}

std::vector<agentid::schema::credential_record_t>
repository::list_credentials_by_issuer(std::string_view issuer_id) const {
  return load_indexed_credentials(
      storage_, key::make_prefix(key::kIssuerCredentialIndexPrefix, issuer_id));
}

std::vector<agentid::schema::credential_record_t>
repository::list_credentials_by_policy(std::string_view policy_id) const {
  return load_indexed_credentials(
      storage_, key::make_prefix(key::kPolicyCredentialIndexPrefix, policy_id));
}

revoke_outcome repository::revoke_credential(
    std::string_view credential_id,
    std::string_view reason,
    agentid::schema::timestamp_milliseconds_t at,
    std::string revocation_id) {
  auto lock = std::scoped_lock{mutex_};
  auto previous = get_credential(credential_id);
  if (!previous) {
    return revoke_outcome{.state = revoke_state::not_found};
  }
  if (previous->status == agentid::schema::credential_status_t::revoked) {
    return revoke_outcome{.state = revoke_state::already_revoked,
                          .credential = std::move(previous)};
  }

  auto updated = *previous;
  updated.status = agentid::schema::credential_status_t::revoked;
  updated.revoked_at = at;
  updated.revocation_reason = std::string{reason};
  updated.updated_at = at;

  auto batch = write_batch{};
  stage_credential(batch, updated, &*previous);
  auto event = agentid::schema::revocation_event_t{
      .sequence = next_sequence("revocation", batch),
      .revocation_id = std::move(revocation_id),
      .credential_id = updated.credential_id,
      .issuer_id = updated.issuer_id,
      .agent_id = updated.agent_id,
      .reason = std::string{reason},
      .revoked_at = at};
  batch.put(key::make_revocation_stream_key(event.sequence),
            codec::encode(event));
  storage_.commit(batch);

  return revoke_outcome{.state = revoke_state::revoked,
                        .credential = std::move(updated),
                        .event = std::move(event)};
}

std::vector<agentid::schema::revocation_event_t> repository::list_revocations(
    const revocation_query& query) const {
  auto out = std::vector<agentid::schema::revocation_event_t>{};
  if (query.limit == 0) {
    return out;
  }
  auto events = load_prefix<agentid::schema::revocation_event_t>(
      storage_, key::make_prefix(key::kRevocationStreamPrefix));
  for (auto& event : events) {
    if (event.revoked_at <= query.since) {
      continue;
    }
    if (!query.credential_ids.empty() &&
        std::ranges::find(query.credential_ids, event.credential_id) ==
            std::end(query.credential_ids)) {
      continue;
    }
    out.push_back(std::move(event));
    if (out.size() >= query.limit) {
      break;
    }
  }
  return out;
}

std::optional<agentid::schema::policy_record_t> repository::get_policy(
    std::string_view policy_id) const {
  return load<agentid::schema::policy_record_t>(storage_,
                                                key::make_policy_key(policy_id));
}

std::optional<agentid::schema::policy_record_t>
repository::find_policy_by_name(std::string_view issuer_id,
                                std::string_view name) const {
  auto raw =
      storage_.get(make_bytes_view(key::make_policy_name_key(issuer_id, name)));
  if (!raw) {
    return std::nullopt;
  }
  return get_policy(agentid::schema::make_string_view(*raw));
}

std::vector<agentid::schema::policy_record_t> repository::list_policies(
    std::string_view issuer_id) const {
  auto policies = load_prefix<agentid::schema::policy_record_t>(
      storage_, key::make_prefix(key::kPolicyPrefix));
  std::erase_if(policies, [&](const auto& policy) {
    return policy.issuer_id != issuer_id;
  });
  return policies;
}

void repository::save_policy(
    const agentid::schema::policy_record_t& policy,
    const agentid::schema::policy_version_record_t& snapshot,
    std::optional<std::string> previous_name) {
  auto lock = std::scoped_lock{mutex_};
  auto batch = write_batch{};
  batch.put(key::make_policy_key(policy.policy_id), codec::encode(policy));
  batch.put(key::make_policy_version_key(snapshot.policy_id,
                                         snapshot.policy_version),
            codec::encode(snapshot));
  batch.put(key::make_policy_name_key(policy.issuer_id, policy.name),
            make_bytes(policy.policy_id));
  if (previous_name && *previous_name != policy.name) {
    batch.remove(key::make_policy_name_key(policy.issuer_id, *previous_name));
  }
  storage_.commit(batch);
}

std::vector<agentid::schema::policy_version_record_t>
repository::list_policy_versions(std::string_view policy_id) const {
  return load_prefix<agentid::schema::policy_version_record_t>(
      storage_, key::make_prefix(key::kPolicyVersionPrefix, policy_id));
}

std::vector<agentid::schema::credential_record_t> repository::delete_policy(
    std::string_view policy_id,
    agentid::schema::timestamp_milliseconds_t at) {
  auto lock = std::scoped_lock{mutex_};
  auto policy = get_policy(policy_id);
  if (!policy) {
    return {};
  }

  auto attached = list_credentials_by_policy(policy_id);
  auto batch = write_batch{};
  for (const auto& credential : attached) {
    auto detached = credential;
    detached.policy_id.reset();
    detached.updated_at = at;
    stage_credential(batch, detached, &credential);
  }
  for (const auto& [k, _] : storage_.list_by_prefix(make_bytes_view(
           key::make_prefix(key::kPolicyVersionPrefix, policy_id)))) {
    batch.remove(k);
  }
  batch.remove(key::make_policy_name_key(policy->issuer_id, policy->name));
  batch.remove(key::make_policy_key(policy_id));
  storage_.commit(batch);
  return attached;
}

std::optional<agentid::schema::reputation_record_t> repository::get_reputation(
    std::string_view credential_id) const {
  return load<agentid::schema::reputation_record_t>(
      storage_, key::make_reputation_key(credential_id));
}

void repository::put_reputation(
    const agentid::schema::reputation_record_t& record) {
  auto encoded = codec::encode(record);
  storage_.put(make_bytes_view(key::make_reputation_key(record.credential_id)),
               make_bytes_view(encoded));
}

agentid::schema::trust_score_change_t repository::put_reputation(
    const agentid::schema::reputation_record_t& record,
    agentid::schema::trust_score_change_t change) {
  auto lock = std::scoped_lock{mutex_};
  auto batch = write_batch{};
  change.change_id = next_sequence("trust_history", batch);
  batch.put(key::make_reputation_key(record.credential_id), codec::encode(record));
  batch.put(key::make_trust_history_key(change.credential_id, change.change_id),
            codec::encode(change));
  storage_.commit(batch);
  return change;
}

std::vector<agentid::schema::trust_score_change_t>
repository::list_trust_history(std::string_view credential_id) const {
  return load_prefix<agentid::schema::trust_score_change_t>(
      storage_, key::make_prefix(key::kTrustHistoryPrefix, credential_id));
}

std::vector<agentid::schema::reputation_record_t>
repository::list_reputations() const {
  return load_prefix<agentid::schema::reputation_record_t>(
      storage_, key::make_prefix(key::kReputationPrefix));
}

void repository::put_grant(const agentid::schema::authorization_grant_t& grant) {
  auto batch = write_batch{};
  batch.put(key::make_grant_key(grant.grant_id), codec::encode(grant));
  batch.put(key::make_grant_pair_key(grant.requester_credential_id,
                                     grant.grantor_credential_id,
                                     grant.grant_id),
            make_bytes(grant.grant_id));
  storage_.commit(batch);
}

std::optional<agentid::schema::authorization_grant_t> repository::get_grant(
    std::string_view grant_id) const {
  return load<agentid::schema::authorization_grant_t>(
      storage_, key::make_grant_key(grant_id));
}

std::vector<agentid::schema::authorization_grant_t> repository::list_grants(
    std::string_view requester_credential_id,
    std::string_view grantor_credential_id) const {
  auto prefix = key::builder{}
                    .write(key::kGrantPairIndexPrefix)
                    .segment(requester_credential_id)
                    .separator()
                    .segment(grantor_credential_id)
                    .separator()
                    .data;
  auto out = std::vector<agentid::schema::authorization_grant_t>{};
  for (const auto& [k, _] : storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto grant = get_grant(key::index_tail(make_bytes_view(k)));
    if (grant) {
      out.push_back(std::move(*grant));
    }
  }
  return out;
}

std::vector<agentid::schema::authorization_grant_t> repository::list_grants()
    const {
  return load_prefix<agentid::schema::authorization_grant_t>(
      storage_, key::make_prefix(key::kGrantPrefix));
}

uint64_t repository::next_sequence(std::string_view name,
                                   write_batch& batch) const {
  auto encoder = agentid::schema::encoding::scale_encoder_t{};
  auto sequence_key = key::make_sequence_key(name);
  auto current = uint64_t{0};
  if (auto raw = storage_.get(make_bytes_view(sequence_key))) {
    auto decoded = encoder.try_decode<uint64_t>(make_bytes_view(*raw));
    if (!decoded) {
      throw storage_error{"corrupt sequence counter"};
    }
    current = *decoded;
  }
  auto next = current + 1;
  batch.put(std::move(sequence_key), encoder.encode(next));
  return next;
}

agentid::schema::verification_event_t repository::append_verification_event(
    agentid::schema::verification_event_t event) {
  auto lock = std::scoped_lock{mutex_};
  auto batch = write_batch{};
  event.event_id = next_sequence("verification", batch);
  batch.put(key::make_verification_log_key(event.event_id),
            codec::encode(event));
  storage_.commit(batch);
  return event;
}

std::vector<agentid::schema::verification_event_t>
repository::list_verification_events(
    std::optional<std::string> credential_id) const {
  auto events = load_prefix<agentid::schema::verification_event_t>(
      storage_, key::make_prefix(key::kVerificationLogPrefix));
  if (credential_id) {
    std::erase_if(events, [&](const auto& event) {
      return event.credential_id != credential_id;
    });
  }
  return events;
}

agentid::schema::audit_entry_t repository::append_audit_entry(
    agentid::schema::audit_entry_t entry) {
  auto lock = std::scoped_lock{mutex_};
  auto batch = write_batch{};
  entry.entry_id = next_sequence("audit", batch);
  batch.put(key::make_audit_log_key(entry.entry_id), codec::encode(entry));
  storage_.commit(batch);
  return entry;
}

std::vector<agentid::schema::audit_entry_t> repository::list_audit_entries(
    std::optional<std::string> issuer_id) const {
  auto entries = load_prefix<agentid::schema::audit_entry_t>(
      storage_, key::make_prefix(key::kAuditLogPrefix));
  if (issuer_id) {
    std::erase_if(entries, [&](const auto& entry) {
      return entry.issuer_id != *issuer_id;
    });
  }
  return entries;
}

void repository::put_subscription(
    const agentid::schema::webhook_subscription_t& subscription) {
  auto encoded = codec::encode(subscription);
  storage_.put(make_bytes_view(key::make_webhook_subscription_key(
                   subscription.subscription_id)),
               make_bytes_view(encoded));
}

std::optional<agentid::schema::webhook_subscription_t>
repository::get_subscription(std::string_view subscription_id) const {
  return load<agentid::schema::webhook_subscription_t>(
      storage_, key::make_webhook_subscription_key(subscription_id));
}

std::vector<agentid::schema::webhook_subscription_t>
repository::list_subscriptions(std::string_view issuer_id) const {
  auto subscriptions = load_prefix<agentid::schema::webhook_subscription_t>(
      storage_, key::make_prefix(key::kWebhookSubscriptionPrefix));
  std::erase_if(subscriptions, [&](const auto& subscription) {
    return subscription.issuer_id != issuer_id;
  });
  return subscriptions;
}

void repository::put_delivery(
    const agentid::schema::webhook_delivery_t& delivery) {
  auto encoded = codec::encode(delivery);
  storage_.put(
      make_bytes_view(key::make_webhook_delivery_key(delivery.delivery_id)),
      make_bytes_view(encoded));
}

std::optional<agentid::schema::webhook_delivery_t> repository::get_delivery(
    std::string_view delivery_id) const {
  return load<agentid::schema::webhook_delivery_t>(
      storage_, key::make_webhook_delivery_key(delivery_id));
}

std::vector<agentid::schema::webhook_delivery_t> repository::list_deliveries()
    const {
  return load_prefix<agentid::schema::webhook_delivery_t>(
      storage_, key::make_prefix(key::kWebhookDeliveryPrefix));
}

}  // namespace agentid::storage
