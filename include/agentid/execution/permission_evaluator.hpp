#pragma once

#include <agentid/execution/rate_limiter.hpp>
#include <agentid/schema/json.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::execution {

/// Actions that also cover any "<action>:<qualifier>" request.
inline constexpr auto kStandardActions =
    std::array<std::string_view, 4>{"read", "write", "transact", "communicate"};

struct permission_request final {
  std::string action;
  std::optional<std::string> resource;
};

/// Request-time facts that conditions are evaluated against. `day` is a
/// lower-case English weekday name. `credential_id` keys the per-credential
/// request counters.
struct permission_context final {
  std::optional<std::string> region;
  std::optional<uint32_t> hour;
  std::optional<std::string> day;
  std::optional<std::string> credential_id;
};

struct permission_rate_limit final {
  uint64_t minute_remaining{};
  uint64_t day_remaining{};
};

struct permission_check_result final {
  std::string action;
  bool granted{};
  std::optional<std::string> reason;
  std::vector<std::string> conditions_applied;
  std::optional<permission_rate_limit> rate_limit;
};

/// One entry of a credential or policy permission set after normalisation.
struct normalized_permission final {
  std::string action;
  std::vector<std::string> domains;
  std::vector<std::string> resources;
  agentid::schema::json_t conditions = agentid::schema::json_t::object();
};

/// Accepts every permission shape in circulation: an array of action
/// strings, an array of {action, domains?, resources?, conditions?}, an
/// array of policy entries {resource, actions[], conditions?}, and the
/// legacy object {actions[], domains[], resource_limits{}}.
std::vector<normalized_permission> normalize_permissions(
    const agentid::schema::json_t& permissions);

bool action_matches(std::string_view requested, std::string_view pattern);
bool resource_matches(std::string_view requested, std::string_view pattern);

/// Decide whether `permissions` allow `request` in `context`. Rate-limit
/// conditions are enforced only when a limiter and a credential id are
/// supplied; otherwise they are reported in conditions_applied.
permission_check_result check_permission(
    const permission_request& request,
    const agentid::schema::json_t& permissions,
    const permission_context& context,
    rate_limiter* limiter = nullptr);

/// Numeric member `name` of `object` as a whole count of at least one.
/// Values beyond the uint64_t range saturate.
std::optional<uint64_t> positive_limit(const agentid::schema::json_t& object,
                                       std::string_view name);

/// Lower-case English weekday name, 0 = sunday.
std::string_view weekday_name(uint32_t weekday);

agentid::schema::json_t to_json(const permission_check_result& result);

}  // namespace agentid::execution
