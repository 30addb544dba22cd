#pragma once

#include <agentid/common/time.hpp>
#include <agentid/execution/rate_limiter.hpp>
#include <agentid/execution/side_effects.hpp>
#include <agentid/schema/authorization_grant.hpp>
#include <agentid/schema/json.hpp>
#include <agentid/schema/operation_result.hpp>
#include <agentid/storage/repository.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::execution {

struct grant_request final {
  // Issuer that owns the requester credential.
  std::string issuer_id;
  std::string requester_credential_id;
  std::string grantor_credential_id;
  // Non-empty array of {action, resource?, constraints?}.
  agentid::schema::json_t permissions = agentid::schema::json_t::array();
  agentid::schema::json_t constraints = agentid::schema::json_t::object();
  std::optional<agentid::schema::timestamp_milliseconds_t> valid_until;
  std::string message;
};

/// Overrides for the evaluation context. Anything left empty is taken from
/// the clock (UTC hour and weekday) or treated as unknown (region).
struct authorization_context final {
  std::optional<std::string> region;
  std::optional<uint32_t> hour;
  std::optional<std::string> day;
};

struct authorization_query final {
  std::string requester_credential_id;
  std::string grantor_credential_id;
  std::string action;
  std::optional<std::string> resource;
  authorization_context context;
};

struct authorization_decision final {
  bool authorized{};
  std::optional<std::string> authorization_id;
  std::vector<std::string> constraints_applied;
  std::optional<agentid::schema::timestamp_milliseconds_t> valid_until;
  std::optional<uint64_t> rate_limit_remaining;
  std::optional<std::string> reason;
};

/// Outcome of one constraint evaluation against a merged constraint object.
struct constraint_evaluation final {
  bool granted{};
  std::optional<std::string> reason;
  std::vector<std::string> constraints_applied;
  std::optional<uint64_t> rate_limit_remaining;
};

/// "*" matches anything, "x.*" matches "x.<anything>", otherwise exact.
bool grant_action_matches(std::string_view pattern, std::string_view action);

/// "H:MM-H:MM" by start hour and end hour; the end hour is exclusive and an
/// end before the start wraps past midnight. Malformed windows admit.
bool within_time_window(uint32_t hour, std::string_view window);

agentid::schema::json_t to_json(const authorization_decision& decision);

/// Agent-to-agent grants: one credential asks another for permissions, the
/// grantor approves or denies, and relying parties ask whether a requester
/// may perform an action under an approved grant right now.
class authorization_checker final {
 public:
  authorization_checker(agentid::storage::repository& repository,
                        rate_limiter& limiter,
                        side_effects& effects,
                        agentid::common::clock_fn_t clock);

  agentid::schema::operation_result<agentid::schema::authorization_grant_t>
  create_grant(const grant_request& request);

  /// Approve or deny a pending grant. `issuer_id` must own the grantor
  /// credential.
  agentid::schema::operation_result<agentid::schema::authorization_grant_t>
  respond(std::string_view issuer_id, std::string_view grant_id, bool approve);

  /// Withdraw an approved grant. `issuer_id` must own the grantor credential.
  agentid::schema::operation_result<agentid::schema::authorization_grant_t>
  revoke(std::string_view issuer_id, std::string_view grant_id);

  /// Mark approved grants past valid_until as expired; returns their ids.
  std::vector<std::string> expire_grants();

  /// Read-only with respect to grants; only the in-memory request counters
  /// advance.
  authorization_decision check(const authorization_query& query);

  constraint_evaluation evaluate_constraints(
      const agentid::schema::json_t& constraints,
      const authorization_context& context,
      std::string_view authorization_id,
      std::string_view action);

  std::optional<agentid::schema::authorization_grant_t> get(
      std::string_view grant_id) const;

  /// Grants in which the credential is requester or grantor.
  std::vector<agentid::schema::authorization_grant_t> list(
      std::string_view credential_id) const;

 private:
  agentid::storage::repository& repository_;
  rate_limiter& limiter_;
  side_effects& effects_;
  agentid::common::clock_fn_t clock_;
  std::mutex mutex_;
};

}  // namespace agentid::execution
