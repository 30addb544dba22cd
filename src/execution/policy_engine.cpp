#include <agentid/execution/policy_engine.hpp>

#include <agentid/crypto/random.hpp>
#include <agentid/schema/credential_status.hpp>
#include <agentid/schema/policy_change_type.hpp>

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace agentid::execution {

namespace {

using agentid::schema::operation_error_code;

std::optional<std::string> validate_fields(
    const std::optional<std::string>& name,
    const std::optional<std::string>& description,
    const std::optional<agentid::schema::json_t>& permissions,
    const std::optional<std::string>& change_reason) {
  if (name && (name->empty() || name->size() > kMaxPolicyNameLength)) {
    return "Policy name must be 1-100 characters";
  }
  if (description && description->size() > kMaxPolicyDescriptionLength) {
    return "Policy description must be at most 500 characters";
  }
  if (permissions && !is_valid_permission_set(*permissions)) {
    return "Permissions must be an array of strings or objects";
  }
  if (change_reason && change_reason->size() > kMaxChangeReasonLength) {
    return "Change reason must be at most 500 characters";
  }
  return std::nullopt;
}

}  // namespace

bool is_valid_permission_set(const agentid::schema::json_t& permissions) {
  if (!permissions.is_array()) {
    return false;
  }
  return std::ranges::all_of(permissions, [](const auto& entry) {
    return entry.is_string() || entry.is_object();
  });
}

policy_engine::policy_engine(agentid::storage::repository& repository,
                             side_effects& effects,
                             agentid::common::clock_fn_t clock)
    : repository_{repository}, effects_{effects}, clock_{std::move(clock)} {}

agentid::schema::operation_result<upsert_policy_outcome> policy_engine::upsert(
    const upsert_policy_request& request) {
  using result_t = agentid::schema::operation_result<upsert_policy_outcome>;
  if (auto error = validate_fields(request.name, request.description,
                                   request.permissions, request.change_reason)) {
    return result_t::failure(operation_error_code::invalid_request,
                             std::move(*error));
  }
  if (!repository_.get_issuer(request.issuer_id)) {
    return result_t::failure(operation_error_code::issuer_not_found,
                             "Issuer not found");
  }

  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  auto existing = repository_.find_policy_by_name(request.issuer_id, request.name);
  if (!existing) {
    auto policy = agentid::schema::policy_record_t{
        .policy_id = agentid::crypto::make_uuid(),
        .issuer_id = request.issuer_id,
        .name = request.name,
        .description = request.description.value_or(""),
        .permissions = request.permissions,
        .policy_version = 1,
        .is_active = true,
        .created_at = now,
        .updated_at = now};
    repository_.save_policy(
        policy, agentid::schema::policy_version_record_t{
                    .policy_id = policy.policy_id,
                    .policy_version = 1,
                    .permissions = policy.permissions,
                    .change_type = agentid::schema::policy_change_type_t::created,
                    .change_reason = request.change_reason.value_or(""),
                    .created_at = now});
    effects_.audit(policy.issuer_id, "policy.created", "policy",
                   policy.policy_id,
                   {{"name", policy.name}, {"version", policy.policy_version}});
    spdlog::info("Policy {} '{}' created for issuer {}", policy.policy_id,
                 policy.name, policy.issuer_id);
    return result_t::success(upsert_policy_outcome{
        .policy_id = policy.policy_id, .created = true, .version = 1});
  }

  auto policy = std::move(*existing);
  policy.permissions = request.permissions;
  if (request.description) {
    policy.description = *request.description;
  }
  ++policy.policy_version;
  policy.updated_at = now;
  repository_.save_policy(
      policy, agentid::schema::policy_version_record_t{
                  .policy_id = policy.policy_id,
                  .policy_version = policy.policy_version,
                  .permissions = policy.permissions,
                  .change_type = agentid::schema::policy_change_type_t::updated,
                  .change_reason = request.change_reason.value_or(""),
                  .created_at = now});
  effects_.audit(policy.issuer_id, "policy.updated", "policy", policy.policy_id,
                 {{"name", policy.name}, {"version", policy.policy_version}});
  return result_t::success(upsert_policy_outcome{.policy_id = policy.policy_id,
                                                 .created = false,
                                                 .version = policy.policy_version});
}

agentid::schema::operation_result<update_policy_outcome> policy_engine::update(
    const update_policy_request& request) {
  using result_t = agentid::schema::operation_result<update_policy_outcome>;
  if (auto error = validate_fields(request.name, request.description,
                                   request.permissions, request.change_reason)) {
    return result_t::failure(operation_error_code::invalid_request,
                             std::move(*error));
  }

  auto lock = std::scoped_lock{mutex_};
  auto existing = repository_.get_policy(request.policy_id);
  if (!existing || existing->issuer_id != request.issuer_id) {
    return result_t::failure(operation_error_code::policy_not_found,
                             "Policy not found");
  }
  auto policy = *existing;
  auto previous_name = std::optional<std::string>{};
  if (request.name && *request.name != policy.name) {
    if (repository_.find_policy_by_name(policy.issuer_id, *request.name)) {
      return result_t::failure(
          operation_error_code::invalid_request,
          fmt::format("A policy named '{}' already exists", *request.name));
    }
    previous_name = policy.name;
    policy.name = *request.name;
  }
  if (request.description) {
    policy.description = *request.description;
  }
  if (request.permissions) {
    policy.permissions = *request.permissions;
  }

  auto change_type = agentid::schema::policy_change_type_t::updated;
  if (request.is_active && *request.is_active != policy.is_active) {
    policy.is_active = *request.is_active;
    change_type = policy.is_active
                      ? agentid::schema::policy_change_type_t::activated
                      : agentid::schema::policy_change_type_t::deactivated;
  }

  auto now = clock_();
  ++policy.policy_version;
  policy.updated_at = now;
  repository_.save_policy(
      policy,
      agentid::schema::policy_version_record_t{
          .policy_id = policy.policy_id,
          .policy_version = policy.policy_version,
          .permissions = policy.permissions,
          .change_type = change_type,
          .change_reason = request.change_reason.value_or(""),
          .created_at = now},
      std::move(previous_name));

  auto affected = count_active_attached(policy.policy_id);
  effects_.audit(policy.issuer_id, "policy.updated", "policy", policy.policy_id,
                 {{"name", policy.name},
                  {"version", policy.policy_version},
                  {"change_type", std::string{to_string(change_type)}},
                  {"affected_credentials", affected}});
  spdlog::info("Policy {} now at version {} ({} active credentials)",
               policy.policy_id, policy.policy_version, affected);
  return result_t::success(
      update_policy_outcome{.policy = std::move(policy),
                            .affected_credentials = affected,
                            .live_update = request.permissions.has_value()});
}

agentid::schema::operation_result<std::size_t> policy_engine::assign(
    const std::string_view issuer_id,
    const std::string_view credential_id,
    const std::string_view policy_id) {
  using result_t = agentid::schema::operation_result<std::size_t>;
  // Held across the attach so a concurrent delete cannot strand it.
  auto lock = std::scoped_lock{mutex_};
  auto policy = repository_.get_policy(policy_id);
  if (!policy || policy->issuer_id != issuer_id) {
    return result_t::failure(operation_error_code::policy_not_found,
                             "Policy not found");
  }

  auto error = std::optional<result_t>{};
  auto outcome = repository_.modify_credential(
      credential_id, [&](agentid::schema::credential_record_t& credential) {
        if (credential.issuer_id != issuer_id) {
          error = result_t::failure(operation_error_code::issuer_mismatch,
                                    "Credential and policy belong to "
                                    "different issuers");
          return false;
        }
        credential.policy_id = std::string{policy_id};
        credential.updated_at = clock_();
        return true;
      });
  if (error) {
    return std::move(*error);
  }
  if (outcome.state == agentid::storage::modify_state::not_found) {
    return result_t::failure(operation_error_code::credential_not_found,
                             "Credential not found");
  }
  if (outcome.state != agentid::storage::modify_state::modified) {
    return result_t::failure(operation_error_code::internal_error,
                             "Credential could not be updated");
  }

  auto affected = count_active_attached(policy_id);
  effects_.audit(std::string{issuer_id}, "policy.assigned", "credential",
                 std::string{credential_id},
                 {{"policy_id", std::string{policy_id}},
                  {"policy_name", policy->name}});
  return result_t::success(affected);
}

agentid::schema::operation_result<std::size_t> policy_engine::remove(
    const std::string_view issuer_id,
    const std::string_view credential_id) {
  using result_t = agentid::schema::operation_result<std::size_t>;
  auto error = std::optional<result_t>{};
  auto outcome = repository_.modify_credential(
      credential_id, [&](agentid::schema::credential_record_t& credential) {
        if (credential.issuer_id != issuer_id) {
          error = result_t::failure(operation_error_code::credential_not_found,
                                    "Credential not found");
          return false;
        }
        if (!credential.policy_id) {
          return false;
        }
        credential.policy_id.reset();
        credential.updated_at = clock_();
        return true;
      });
  if (error) {
    return std::move(*error);
  }
  switch (outcome.state) {
    case agentid::storage::modify_state::not_found:
      return result_t::failure(operation_error_code::credential_not_found,
                               "Credential not found");
    case agentid::storage::modify_state::rejected:
      return result_t::success(0);
    case agentid::storage::modify_state::conflict:
      return result_t::failure(operation_error_code::internal_error,
                               "Credential could not be updated");
    case agentid::storage::modify_state::modified:
      break;
  }

  effects_.audit(std::string{issuer_id}, "policy.removed", "credential",
                 std::string{credential_id},
                 {{"policy_id", outcome.before->policy_id.value_or("")}});
  auto active =
      outcome.after->status == agentid::schema::credential_status_t::active;
  return result_t::success(active ? 1 : 0);
}

agentid::schema::operation_result<std::size_t> policy_engine::remove_policy(
    const std::string_view issuer_id,
    const std::string_view policy_id) {
  using result_t = agentid::schema::operation_result<std::size_t>;
  auto lock = std::scoped_lock{mutex_};
  auto policy = repository_.get_policy(policy_id);
  if (!policy || policy->issuer_id != issuer_id) {
    return result_t::failure(operation_error_code::policy_not_found,
                             "Policy not found");
  }
  auto detached = repository_.delete_policy(policy_id, clock_());
  effects_.audit(policy->issuer_id, "policy.deleted", "policy",
                 policy->policy_id,
                 {{"name", policy->name},
                  {"affected_credentials", detached.size()}});
  spdlog::info("Policy {} deleted; {} credentials fall back to static "
               "permissions",
               policy->policy_id, detached.size());
  return result_t::success(detached.size());
}

effective_permissions policy_engine::resolve(
    const agentid::schema::credential_record_t& credential) const {
  if (credential.policy_id) {
    auto policy = repository_.get_policy(*credential.policy_id);
    if (policy && policy->is_active) {
      auto permissions = policy->permissions;
      return effective_permissions{.permissions = std::move(permissions),
                                   .policy = std::move(policy)};
    }
  }
  return effective_permissions{.permissions = credential.permissions};
}

std::optional<policy_details> policy_engine::get(
    const std::string_view issuer_id,
    const std::string_view policy_id,
    const std::size_t version_limit) const {
  auto policy = repository_.get_policy(policy_id);
  if (!policy || policy->issuer_id != issuer_id) {
    return std::nullopt;
  }
  auto versions = repository_.list_policy_versions(policy_id);
  std::ranges::reverse(versions);
  if (versions.size() > version_limit) {
    versions.resize(version_limit);
  }
  auto credential_ids = std::vector<std::string>{};
  for (const auto& credential : repository_.list_credentials_by_policy(policy_id)) {
    credential_ids.push_back(credential.credential_id);
  }
  return policy_details{.policy = std::move(*policy),
                        .versions = std::move(versions),
                        .credential_ids = std::move(credential_ids)};
}

std::vector<agentid::schema::policy_record_t> policy_engine::list(
    const std::string_view issuer_id) const {
  return repository_.list_policies(issuer_id);
}

std::size_t policy_engine::count_active_attached(
    const std::string_view policy_id) const {
  auto attached = repository_.list_credentials_by_policy(policy_id);
  return static_cast<std::size_t>(
      std::ranges::count_if(attached, [](const auto& credential) {
        return credential.status == agentid::schema::credential_status_t::active;
      }));
}

}  // namespace agentid::execution
