#include <agentid/execution/credential_lifecycle.hpp>

#include <agentid/crypto/random.hpp>
#include <agentid/execution/credential_payload.hpp>
#include <agentid/execution/policy_engine.hpp>
#include <agentid/schema/agent_type.hpp>
#include <agentid/schema/credential_status.hpp>

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace agentid::execution {

namespace {

using agentid::schema::credential_status_t;
using agentid::schema::operation_error_code;

constexpr auto kMaxAgentIdLength = std::size_t{255};
constexpr auto kMaxAgentNameLength = std::size_t{255};

std::optional<std::string> validate_issue(const issue_request& request,
                                          const agentid::schema::timestamp_milliseconds_t
                                              valid_from) {
  if (request.agent_id.empty() || request.agent_id.size() > kMaxAgentIdLength) {
    return "agent_id must be 1-255 characters";
  }
  if (request.agent_name.empty() ||
      request.agent_name.size() > kMaxAgentNameLength) {
    return "agent_name must be 1-255 characters";
  }
  if (!agentid::schema::is_known_agent_type(request.agent_type)) {
    return fmt::format("Unknown agent_type '{}'", request.agent_type);
  }
  if (!request.permissions.is_array() && !request.permissions.is_object()) {
    return "permissions must be an array or an object";
  }
  if (request.permissions.is_array() &&
      !is_valid_permission_set(request.permissions)) {
    return "permissions must contain strings or objects";
  }
  if (!request.metadata.is_object()) {
    return "metadata must be an object";
  }
  if (request.valid_until <= valid_from) {
    return "valid_until must be after valid_from";
  }
  return std::nullopt;
}

agentid::schema::json_t revocation_details(
    const agentid::schema::revocation_event_t& event) {
  return agentid::schema::json_t{
      {"credential_id", event.credential_id},
      {"agent_id", event.agent_id},
      {"revoked_at", agentid::common::format_iso8601(event.revoked_at)},
      {"revocation_reason", event.reason}};
}

}  // namespace

std::optional<bulk_action> try_parse_bulk_action(const std::string_view value) {
  if (value == "revoke") {
    return bulk_action::revoke;
  }
  if (value == "renew") {
    return bulk_action::renew;
  }
  return std::nullopt;
}

credential_lifecycle::credential_lifecycle(
    agentid::storage::repository& repository,
    const agentid::crypto::signer* signer,
    agentid::events::revocation_bus& bus,
    side_effects& effects,
    agentid::common::clock_fn_t clock)
    : repository_{repository},
      signer_{signer},
      bus_{bus},
      effects_{effects},
      clock_{std::move(clock)} {}

agentid::schema::operation_result<issued_credential> credential_lifecycle::issue(
    const issue_request& request) {
  using result_t = agentid::schema::operation_result<issued_credential>;
  if (signer_ == nullptr) {
    return result_t::failure(operation_error_code::signing_unavailable,
                             "Signing is not configured");
  }
  auto now = clock_();
  auto valid_from = request.valid_from.value_or(now);
  if (auto error = validate_issue(request, valid_from)) {
    return result_t::failure(operation_error_code::invalid_request,
                             std::move(*error));
  }
  auto issuer = repository_.get_issuer(request.issuer_id);
  if (!issuer) {
    return result_t::failure(operation_error_code::issuer_not_found,
                             "Issuer not found");
  }
  if (request.policy_id) {
    auto policy = repository_.get_policy(*request.policy_id);
    if (!policy || policy->issuer_id != issuer->issuer_id) {
      return result_t::failure(operation_error_code::policy_not_found,
                               "Policy not found");
    }
  }
  if (repository_.find_active_credential(issuer->issuer_id, request.agent_id)) {
    return result_t::failure(
        operation_error_code::duplicate_active_credential,
        "An active credential for this agent_id already exists");
  }

  auto record = agentid::schema::credential_record_t{
      .credential_id = agentid::crypto::make_uuid(),
      .issuer_id = issuer->issuer_id,
      .agent_id = request.agent_id,
      .agent_name = request.agent_name,
      .agent_type = request.agent_type,
      .permissions = request.permissions,
      .policy_id = request.policy_id,
      .valid_from = valid_from,
      .valid_until = request.valid_until,
      .geographic_restrictions = request.geographic_restrictions,
      .allowed_services = request.allowed_services,
      .status = credential_status_t::active,
      .key_id = issuer->key_id,
      .metadata = request.metadata,
      .created_at = now,
      .updated_at = now};

  auto payload = make_credential_payload(record, *issuer);
  record.signature = signer_->sign_payload(payload, issuer->issuer_id);
  payload["signature"] = record.signature;
  record.credential_payload = payload.dump();

  // The index check above is advisory; the insert re-checks under the
  // repository lock.
  if (!repository_.insert_credential(record)) {
    return result_t::failure(
        operation_error_code::duplicate_active_credential,
        "An active credential for this agent_id already exists");
  }

  spdlog::info("Issued credential {} to agent {} for issuer {}",
               record.credential_id, record.agent_id, record.issuer_id);
  effects_.audit(record.issuer_id, "credential.issued", "credential",
                 record.credential_id,
                 {{"agent_id", record.agent_id},
                  {"agent_name", record.agent_name},
                  {"valid_until",
                   agentid::common::format_iso8601(record.valid_until)}});
  effects_.webhook(record.issuer_id, "credential.issued",
                   {{"credential_id", record.credential_id},
                    {"agent_id", record.agent_id},
                    {"agent_name", record.agent_name},
                    {"valid_until",
                     agentid::common::format_iso8601(record.valid_until)}});
  return result_t::success(
      issued_credential{.record = std::move(record), .payload = std::move(payload)});
}

void credential_lifecycle::resign(
    agentid::schema::credential_record_t& record) const {
  auto payload = agentid::schema::json_t::parse(record.credential_payload,
                                                nullptr, false);
  if (payload.is_discarded() || !payload.is_object() ||
      !payload.contains("constraints") || !payload["constraints"].is_object()) {
    auto issuer = repository_.get_issuer(record.issuer_id);
    if (!issuer) {
      throw std::runtime_error{"issuer of a stored credential is missing"};
    }
    spdlog::warn("Stored payload of credential {} unreadable; rebuilding",
                 record.credential_id);
    payload = make_credential_payload(record, *issuer);
  }
  payload.erase("signature");
  payload["constraints"]["valid_until"] =
      agentid::common::format_iso8601(record.valid_until);
  record.signature = signer_->sign_payload(payload, record.issuer_id);
  payload["signature"] = record.signature;
  record.credential_payload = payload.dump();
}

agentid::schema::operation_result<agentid::schema::credential_record_t>
credential_lifecycle::renew(const std::string_view issuer_id,
                            const std::string_view credential_id,
                            const std::optional<int64_t> extend_days) {
  using result_t =
      agentid::schema::operation_result<agentid::schema::credential_record_t>;
  if (signer_ == nullptr) {
    return result_t::failure(operation_error_code::signing_unavailable,
                             "Signing is not configured");
  }
  auto days = extend_days.value_or(kDefaultExtendDays);
  if (days < kMinExtendDays || days > kMaxExtendDays) {
    return result_t::failure(operation_error_code::invalid_extend_days,
                             "extend_days must be between 1 and 365");
  }

  auto error = std::optional<result_t>{};
  auto now = clock_();
  auto outcome = repository_.modify_credential(
      credential_id, [&](agentid::schema::credential_record_t& credential) {
        if (credential.issuer_id != issuer_id) {
          error = result_t::failure(operation_error_code::credential_not_found,
                                    "Credential not found");
          return false;
        }
        if (credential.status == credential_status_t::revoked) {
          error = result_t::failure(operation_error_code::credential_revoked,
                                    "Cannot renew a revoked credential");
          return false;
        }
        credential.valid_until =
            std::max(credential.valid_until, now) +
            static_cast<uint64_t>(days) * agentid::schema::kMillisecondsPerDay;
        credential.status = credential_status_t::active;
        credential.updated_at = now;
        resign(credential);
        return true;
      });
  if (error) {
    return std::move(*error);
  }
  switch (outcome.state) {
    case agentid::storage::modify_state::not_found:
    case agentid::storage::modify_state::rejected:
      return result_t::failure(operation_error_code::credential_not_found,
                               "Credential not found");
    case agentid::storage::modify_state::conflict:
      return result_t::failure(
          operation_error_code::duplicate_active_credential,
          "Another active credential exists for this agent_id");
    case agentid::storage::modify_state::modified:
      break;
  }

  const auto& renewed = *outcome.after;
  effects_.audit(renewed.issuer_id, "credential.renewed", "credential",
                 renewed.credential_id,
                 {{"agent_id", renewed.agent_id},
                  {"previous_valid_until",
                   agentid::common::format_iso8601(outcome.before->valid_until)},
                  {"new_valid_until",
                   agentid::common::format_iso8601(renewed.valid_until)},
                  {"extend_days", days}});
  return result_t::success(renewed);
}

agentid::schema::operation_result<agentid::schema::revocation_event_t>
credential_lifecycle::revoke(const std::string_view issuer_id,
                             const std::string_view credential_id,
                             std::optional<std::string> reason) {
  using result_t =
      agentid::schema::operation_result<agentid::schema::revocation_event_t>;
  auto existing = repository_.get_credential(credential_id);
  if (!existing || existing->issuer_id != issuer_id) {
    return result_t::failure(operation_error_code::credential_not_found,
                             "Credential not found");
  }
  auto why = reason && !reason->empty() ? std::move(*reason)
                                        : std::string{kDefaultRevocationReason};
  auto outcome = repository_.revoke_credential(credential_id, why, clock_(),
                                               agentid::crypto::make_uuid());
  switch (outcome.state) {
    case agentid::storage::revoke_state::not_found:
      return result_t::failure(operation_error_code::credential_not_found,
                               "Credential not found");
    case agentid::storage::revoke_state::already_revoked:
      return result_t::failure(operation_error_code::already_revoked,
                               "Already revoked");
    case agentid::storage::revoke_state::revoked:
      break;
  }

  const auto& event = *outcome.event;
  auto delivered = bus_.publish(event);
  spdlog::info("Revoked credential {} (sequence {}, {} live subscribers)",
               event.credential_id, event.sequence, delivered);
  auto details = revocation_details(event);
  effects_.audit(event.issuer_id, "credential.revoked", "credential",
                 event.credential_id, details);
  effects_.webhook(event.issuer_id, "credential.revoked", std::move(details));
  return result_t::success(event);
}

agentid::schema::operation_result<agentid::schema::credential_record_t>
credential_lifecycle::transition(const std::string_view issuer_id,
                                 const std::string_view credential_id,
                                 const credential_status_t from,
                                 const credential_status_t to) {
  using result_t =
      agentid::schema::operation_result<agentid::schema::credential_record_t>;
  auto error = std::optional<result_t>{};
  auto outcome = repository_.modify_credential(
      credential_id, [&](agentid::schema::credential_record_t& credential) {
        if (credential.issuer_id != issuer_id) {
          error = result_t::failure(operation_error_code::credential_not_found,
                                    "Credential not found");
          return false;
        }
        if (credential.status != from) {
          error = result_t::failure(
              operation_error_code::invalid_transition,
              fmt::format("Cannot move a {} credential to {}",
                          to_string(credential.status), to_string(to)));
          return false;
        }
        credential.status = to;
        credential.updated_at = clock_();
        return true;
      });
  if (error) {
    return std::move(*error);
  }
  switch (outcome.state) {
    case agentid::storage::modify_state::not_found:
    case agentid::storage::modify_state::rejected:
      return result_t::failure(operation_error_code::credential_not_found,
                               "Credential not found");
    case agentid::storage::modify_state::conflict:
      return result_t::failure(
          operation_error_code::duplicate_active_credential,
          "Another active credential exists for this agent_id");
    case agentid::storage::modify_state::modified:
      break;
  }
  spdlog::info("Credential {} {} -> {}", credential_id, to_string(from),
               to_string(to));
  return result_t::success(std::move(*outcome.after));
}

agentid::schema::operation_result<agentid::schema::credential_record_t>
credential_lifecycle::suspend(const std::string_view issuer_id,
                              const std::string_view credential_id) {
  return transition(issuer_id, credential_id, credential_status_t::active,
                    credential_status_t::suspended);
}

agentid::schema::operation_result<agentid::schema::credential_record_t>
credential_lifecycle::reinstate(const std::string_view issuer_id,
                                const std::string_view credential_id) {
  return transition(issuer_id, credential_id, credential_status_t::suspended,
                    credential_status_t::active);
}

agentid::schema::operation_result<bulk_outcome> credential_lifecycle::bulk(
    const bulk_request& request) {
  using result_t = agentid::schema::operation_result<bulk_outcome>;
  if (request.credential_ids.empty()) {
    return result_t::failure(operation_error_code::batch_empty,
                             "credential_ids cannot be empty");
  }
  if (request.credential_ids.size() > kMaxBulkCredentials) {
    return result_t::failure(operation_error_code::batch_too_large,
                             "Maximum 100 credentials per bulk operation");
  }
  auto action = try_parse_bulk_action(request.action);
  if (!action) {
    return result_t::failure(
        operation_error_code::invalid_request,
        fmt::format("Unknown action: {}. Supported: revoke, renew",
                    request.action));
  }
  if (*action == bulk_action::renew) {
    auto days = request.extend_days.value_or(kDefaultExtendDays);
    if (days < kMinExtendDays || days > kMaxExtendDays) {
      return result_t::failure(operation_error_code::invalid_extend_days,
                               "extend_days must be between 1 and 365");
    }
    if (signer_ == nullptr) {
      return result_t::failure(operation_error_code::signing_unavailable,
                               "Signing is not configured");
    }
  }

  auto outcome = bulk_outcome{.action = *action};
  outcome.results.reserve(request.credential_ids.size());
  for (const auto& credential_id : request.credential_ids) {
    auto item = bulk_item_result{.credential_id = credential_id};
    if (*action == bulk_action::revoke) {
      auto revoked = revoke(request.issuer_id, credential_id,
                            request.reason.value_or(
                                std::string{kBulkRevocationReason}));
      item.success = revoked.ok();
      if (!revoked.ok()) {
        item.error = revoked.message;
      }
    } else {
      auto renewed = renew(request.issuer_id, credential_id, request.extend_days);
      item.success = renewed.ok();
      if (renewed.code == operation_error_code::credential_revoked) {
        item.error = "Cannot renew revoked credential";
      } else if (!renewed.ok()) {
        item.error = renewed.message;
      }
    }
    if (item.success) {
      ++outcome.successful;
    } else {
      ++outcome.failed;
    }
    outcome.results.push_back(std::move(item));
  }
  outcome.total = outcome.results.size();
  spdlog::info("Bulk {} for issuer {}: {} ok, {} failed",
               *action == bulk_action::revoke ? "revoke" : "renew",
               request.issuer_id, outcome.successful, outcome.failed);
  return result_t::success(std::move(outcome));
}

std::size_t credential_lifecycle::mark_expired() {
  auto now = clock_();
  auto changed = std::size_t{0};
  for (const auto& candidate : repository_.list_credentials()) {
    if (candidate.status != credential_status_t::active ||
        candidate.valid_until > now) {
      continue;
    }
    auto outcome = repository_.modify_credential(
        candidate.credential_id,
        [&](agentid::schema::credential_record_t& credential) {
          if (credential.status != credential_status_t::active ||
              credential.valid_until > now) {
            return false;
          }
          credential.status = credential_status_t::expired;
          credential.updated_at = now;
          return true;
        });
    if (outcome.state != agentid::storage::modify_state::modified) {
      continue;
    }
    ++changed;
    const auto& expired = *outcome.after;
    effects_.webhook(expired.issuer_id, "credential.expired",
                     {{"credential_id", expired.credential_id},
                      {"agent_id", expired.agent_id},
                      {"valid_until",
                       agentid::common::format_iso8601(expired.valid_until)}});
  }
  if (changed > 0) {
    spdlog::info("Marked {} credentials expired", changed);
  }
  return changed;
}

std::optional<agentid::schema::credential_record_t> credential_lifecycle::get(
    const std::string_view credential_id) const {
  return repository_.get_credential(credential_id);
}

std::vector<agentid::schema::credential_record_t> credential_lifecycle::list(
    const std::string_view issuer_id) const {
  return repository_.list_credentials_by_issuer(issuer_id);
}

}  // namespace agentid::execution
