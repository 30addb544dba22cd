#pragma once

#include <agentid/common/time.hpp>
#include <agentid/execution/side_effects.hpp>
#include <agentid/schema/credential_record.hpp>
#include <agentid/schema/json.hpp>
#include <agentid/schema/operation_result.hpp>
#include <agentid/schema/policy_record.hpp>
#include <agentid/schema/policy_version_record.hpp>
#include <agentid/storage/repository.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::execution {

inline constexpr auto kMaxPolicyNameLength = std::size_t{100};
inline constexpr auto kMaxPolicyDescriptionLength = std::size_t{500};
inline constexpr auto kMaxChangeReasonLength = std::size_t{500};
inline constexpr auto kDefaultPolicyVersionLimit = std::size_t{10};

struct upsert_policy_request final {
  std::string issuer_id;
  std::string name;
  agentid::schema::json_t permissions = agentid::schema::json_t::array();
  std::optional<std::string> description;
  std::optional<std::string> change_reason;
};

struct upsert_policy_outcome final {
  std::string policy_id;
  bool created{};
  uint32_t version{};
};

/// Partial update; absent members are left unchanged.
struct update_policy_request final {
  std::string issuer_id;
  std::string policy_id;
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<agentid::schema::json_t> permissions;
  std::optional<bool> is_active;
  std::optional<std::string> change_reason;
};

struct update_policy_outcome final {
  agentid::schema::policy_record_t policy;
  std::size_t affected_credentials{};
  bool live_update{};
};

struct policy_details final {
  agentid::schema::policy_record_t policy;
  // Newest first.
  std::vector<agentid::schema::policy_version_record_t> versions;
  std::vector<std::string> credential_ids;
};

/// Permissions in force for a credential right now.
struct effective_permissions final {
  agentid::schema::json_t permissions = agentid::schema::json_t::array();
  // Set when the permissions came from an assigned, active policy.
  std::optional<agentid::schema::policy_record_t> policy;
};

/// True for an array whose entries are strings or objects.
bool is_valid_permission_set(const agentid::schema::json_t& permissions);

/// Named, versioned permission sets shared by reference. Credentials hold a
/// policy id only; the permissions are looked up on every check, so editing
/// a policy changes the outcome for every attached credential at once
/// without re-signing anything.
class policy_engine final {
 public:
  policy_engine(agentid::storage::repository& repository,
                side_effects& effects,
                agentid::common::clock_fn_t clock);

  /// Create the issuer's policy called `name`, or update it when it exists.
  agentid::schema::operation_result<upsert_policy_outcome> upsert(
      const upsert_policy_request& request);

  agentid::schema::operation_result<update_policy_outcome> update(
      const update_policy_request& request);

  /// Returns the number of active credentials attached after assignment.
  agentid::schema::operation_result<std::size_t> assign(
      std::string_view issuer_id,
      std::string_view credential_id,
      std::string_view policy_id);

  /// Clear the credential's policy reference. Returns 1 when a reference
  /// was removed from an active credential, otherwise 0.
  agentid::schema::operation_result<std::size_t> remove(
      std::string_view issuer_id,
      std::string_view credential_id);

  /// Detach every referencing credential, drop history, delete the policy.
  /// Returns the number of credentials that fell back to their static
  /// permissions.
  agentid::schema::operation_result<std::size_t> remove_policy(
      std::string_view issuer_id,
      std::string_view policy_id);

  effective_permissions resolve(
      const agentid::schema::credential_record_t& credential) const;

  std::optional<policy_details> get(
      std::string_view issuer_id,
      std::string_view policy_id,
      std::size_t version_limit = kDefaultPolicyVersionLimit) const;

  std::vector<agentid::schema::policy_record_t> list(
      std::string_view issuer_id) const;

 private:
  std::size_t count_active_attached(std::string_view policy_id) const;

  agentid::storage::repository& repository_;
  side_effects& effects_;
  agentid::common::clock_fn_t clock_;
  std::mutex mutex_;
};

}  // namespace agentid::execution
