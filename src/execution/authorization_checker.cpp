#include <agentid/execution/authorization_checker.hpp>

#include <agentid/crypto/random.hpp>
#include <agentid/execution/permission_evaluator.hpp>
#include <agentid/schema/credential_status.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace agentid::execution {

namespace {

using agentid::schema::grant_status_t;
using agentid::schema::operation_error_code;

using grant_result_t =
    agentid::schema::operation_result<agentid::schema::authorization_grant_t>;

std::string to_lower(std::string value) {
  std::ranges::transform(value, value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string to_upper(std::string value) {
  std::ranges::transform(value, value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

std::vector<std::string> strings_of(const agentid::schema::json_t& value) {
  auto out = std::vector<std::string>{};
  if (!value.is_array()) {
    return out;
  }
  for (const auto& item : value) {
    if (item.is_string()) {
      out.push_back(item.get<std::string>());
    }
  }
  return out;
}

// Reads "<1-2 digits>:<2 digits>" and returns the hour.
std::optional<uint32_t> read_clock(std::string_view& text) {
  auto hour = uint32_t{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), hour);
  auto digits = static_cast<std::size_t>(end - text.data());
  if (ec != std::errc{} || digits == 0 || digits > 2) {
    return std::nullopt;
  }
  text.remove_prefix(digits);
  if (text.size() < 3 || text[0] != ':' || !std::isdigit(static_cast<unsigned char>(text[1])) ||
      !std::isdigit(static_cast<unsigned char>(text[2]))) {
    return std::nullopt;
  }
  text.remove_prefix(3);
  return hour;
}

const agentid::schema::json_t* find_grant_permission(
    const agentid::schema::json_t& permissions,
    const std::string_view action,
    const std::optional<std::string>& resource) {
  if (!permissions.is_array()) {
    return nullptr;
  }
  for (const auto& permission : permissions) {
    if (!permission.is_object()) {
      continue;
    }
    auto action_it = permission.find("action");
    if (action_it == permission.end() || !action_it->is_string() ||
        !grant_action_matches(action_it->get_ref<const std::string&>(), action)) {
      continue;
    }
    auto resource_it = permission.find("resource");
    if (resource_it == permission.end() || !resource_it->is_string() ||
        resource_it->get_ref<const std::string&>().empty()) {
      return &permission;
    }
    const auto& bound = resource_it->get_ref<const std::string&>();
    if (resource && (bound == *resource || bound == "*")) {
      return &permission;
    }
  }
  return nullptr;
}

bool is_valid_grant_permissions(const agentid::schema::json_t& permissions) {
  if (!permissions.is_array() || permissions.empty()) {
    return false;
  }
  return std::ranges::all_of(permissions, [](const agentid::schema::json_t& entry) {
    if (!entry.is_object()) {
      return false;
    }
    auto action = entry.find("action");
    return action != entry.end() && action->is_string() &&
           !action->get_ref<const std::string&>().empty();
  });
}

agentid::schema::json_t grant_summary(
    const agentid::schema::authorization_grant_t& grant) {
  return agentid::schema::json_t{
      {"authorization_id", grant.grant_id},
      {"requester_credential_id", grant.requester_credential_id},
      {"grantor_credential_id", grant.grantor_credential_id},
      {"status", std::string{to_string(grant.status)}}};
}

}  // namespace

bool grant_action_matches(const std::string_view pattern,
                          const std::string_view action) {
  if (pattern == action || pattern == "*") {
    return true;
  }
  if (pattern.ends_with(".*")) {
    auto prefix = pattern.substr(0, pattern.size() - 1);
    return action.starts_with(prefix);
  }
  return false;
}

bool within_time_window(const uint32_t hour, const std::string_view window) {
  auto rest = window;
  auto start = read_clock(rest);
  if (!start || rest.empty() || rest.front() != '-') {
    return true;
  }
  rest.remove_prefix(1);
  auto end = read_clock(rest);
  if (!end || !rest.empty()) {
    return true;
  }
  if (*start <= *end) {
    return hour >= *start && hour < *end;
  }
  return hour >= *start || hour < *end;
}

agentid::schema::json_t to_json(const authorization_decision& decision) {
  auto out = agentid::schema::json_t{{"authorized", decision.authorized}};
  if (decision.authorization_id) {
    out["authorization_id"] = *decision.authorization_id;
  }
  if (decision.authorized) {
    out["constraints_applied"] = decision.constraints_applied;
    out["valid_until"] = nullptr;
    if (decision.valid_until) {
      out["valid_until"] = agentid::common::format_iso8601(*decision.valid_until);
    }
  }
  if (decision.rate_limit_remaining) {
    out["rate_limit_remaining"] = *decision.rate_limit_remaining;
  }
  if (decision.reason) {
    out["reason"] = *decision.reason;
  }
  return out;
}

authorization_checker::authorization_checker(
    agentid::storage::repository& repository,
    rate_limiter& limiter,
    side_effects& effects,
    agentid::common::clock_fn_t clock)
    : repository_{repository},
      limiter_{limiter},
      effects_{effects},
      clock_{std::move(clock)} {}

grant_result_t authorization_checker::create_grant(const grant_request& request) {
  if (!is_valid_grant_permissions(request.permissions)) {
    return grant_result_t::failure(
        operation_error_code::invalid_request,
        "permissions must be a non-empty array of {action, resource?, "
        "constraints?}");
  }
  if (!request.constraints.is_object()) {
    return grant_result_t::failure(operation_error_code::invalid_request,
                                   "constraints must be an object");
  }
  auto requester = repository_.get_credential(request.requester_credential_id);
  if (!requester) {
    return grant_result_t::failure(operation_error_code::credential_not_found,
                                   "Requester credential not found");
  }
  if (requester->issuer_id != request.issuer_id) {
    return grant_result_t::failure(operation_error_code::issuer_mismatch,
                                   "You do not own this credential");
  }
  auto grantor = repository_.get_credential(request.grantor_credential_id);
  if (!grantor) {
    return grant_result_t::failure(operation_error_code::credential_not_found,
                                   "Grantor credential not found");
  }
  if (grantor->status != agentid::schema::credential_status_t::active) {
    return grant_result_t::failure(operation_error_code::invalid_request,
                                   "Grantor credential is not active");
  }

  auto now = clock_();
  auto grant = agentid::schema::authorization_grant_t{
      .grant_id = agentid::crypto::make_uuid(),
      .requester_credential_id = requester->credential_id,
      .grantor_credential_id = grantor->credential_id,
      .permissions = request.permissions,
      .constraints = request.constraints,
      .status = grant_status_t::pending,
      .valid_until = request.valid_until,
      .message = request.message,
      .created_at = now,
      .updated_at = now};
  repository_.put_grant(grant);
  spdlog::info("Authorization {} requested by {} from {}", grant.grant_id,
               grant.requester_credential_id, grant.grantor_credential_id);

  auto data = grant_summary(grant);
  data["requester_agent_name"] = requester->agent_name;
  data["requested_permissions"] = grant.permissions;
  effects_.webhook(grantor->issuer_id, "authorization.requested", data);
  effects_.audit(requester->issuer_id, "authorization.requested",
                 "authorization", grant.grant_id, std::move(data));
  return grant_result_t::success(std::move(grant));
}

grant_result_t authorization_checker::respond(const std::string_view issuer_id,
                                              const std::string_view grant_id,
                                              const bool approve) {
  auto lock = std::scoped_lock{mutex_};
  auto grant = repository_.get_grant(grant_id);
  if (!grant) {
    return grant_result_t::failure(operation_error_code::grant_not_found,
                                   "Authorization request not found");
  }
  auto grantor = repository_.get_credential(grant->grantor_credential_id);
  if (!grantor || grantor->issuer_id != issuer_id) {
    return grant_result_t::failure(operation_error_code::issuer_mismatch,
                                   "You do not own the grantor credential");
  }
  if (grant->status != grant_status_t::pending) {
    return grant_result_t::failure(
        operation_error_code::invalid_transition,
        "Authorization request not found or already responded");
  }
  auto now = clock_();
  grant->status = approve ? grant_status_t::approved : grant_status_t::denied;
  grant->responded_at = now;
  grant->updated_at = now;
  repository_.put_grant(*grant);
  spdlog::info("Authorization {} {}", grant->grant_id, to_string(grant->status));

  auto data = grant_summary(*grant);
  data["approved"] = approve;
  if (auto requester = repository_.get_credential(grant->requester_credential_id)) {
    effects_.webhook(requester->issuer_id, "authorization.responded", data);
  }
  effects_.audit(std::string{issuer_id}, "authorization.responded",
                 "authorization", grant->grant_id, std::move(data));
  return grant_result_t::success(std::move(*grant));
}

grant_result_t authorization_checker::revoke(const std::string_view issuer_id,
                                             const std::string_view grant_id) {
  auto lock = std::scoped_lock{mutex_};
  auto grant = repository_.get_grant(grant_id);
  if (!grant) {
    return grant_result_t::failure(operation_error_code::grant_not_found,
                                   "Authorization not found");
  }
  auto grantor = repository_.get_credential(grant->grantor_credential_id);
  if (!grantor || grantor->issuer_id != issuer_id) {
    return grant_result_t::failure(operation_error_code::issuer_mismatch,
                                   "You do not own the grantor credential");
  }
  if (grant->status != grant_status_t::approved) {
    return grant_result_t::failure(operation_error_code::invalid_transition,
                                   "Can only revoke approved authorizations");
  }
  grant->status = grant_status_t::revoked;
  grant->updated_at = clock_();
  repository_.put_grant(*grant);
  effects_.audit(std::string{issuer_id}, "authorization.revoked",
                 "authorization", grant->grant_id, grant_summary(*grant));
  return grant_result_t::success(std::move(*grant));
}

std::vector<std::string> authorization_checker::expire_grants() {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  auto expired = std::vector<std::string>{};
  for (auto& grant : repository_.list_grants()) {
    if (grant.status != grant_status_t::approved || !grant.valid_until ||
        *grant.valid_until > now) {
      continue;
    }
    grant.status = grant_status_t::expired;
    grant.updated_at = now;
    repository_.put_grant(grant);
    expired.push_back(grant.grant_id);
  }
  if (!expired.empty()) {
    spdlog::info("Expired {} authorizations", expired.size());
  }
  return expired;
}

constraint_evaluation authorization_checker::evaluate_constraints(
    const agentid::schema::json_t& constraints,
    const authorization_context& context,
    const std::string_view authorization_id,
    const std::string_view action) {
  auto result = constraint_evaluation{};
  if (!constraints.is_object() || constraints.empty()) {
    result.granted = true;
    return result;
  }
  auto& applied = result.constraints_applied;

  auto window_it = constraints.find("time_window");
  if (window_it != constraints.end() && window_it->is_string() && context.hour) {
    applied.emplace_back("time_window");
    const auto& window = window_it->get_ref<const std::string&>();
    if (!within_time_window(*context.hour, window)) {
      result.reason =
          fmt::format("Request outside allowed time window: {}", window);
      return result;
    }
  }

  auto days_it = constraints.find("allowed_days");
  if (days_it != constraints.end() && days_it->is_array() && context.day) {
    applied.emplace_back("allowed_days");
    auto days = strings_of(*days_it);
    auto today = to_lower(*context.day);
    auto allowed = std::ranges::any_of(
        days, [&](const std::string& day) { return to_lower(day) == today; });
    if (!allowed) {
      result.reason = fmt::format("Request not allowed on {}. Allowed days: {}",
                                  *context.day, fmt::join(days, ", "));
      return result;
    }
  }

  auto regions = strings_of(constraints.value("allowed_regions",
                                              agentid::schema::json_t{}));
  if (!regions.empty()) {
    applied.emplace_back("allowed_regions");
    if (context.region) {
      auto region = to_upper(*context.region);
      auto allowed = std::ranges::any_of(regions, [&](const std::string& r) {
        return to_upper(r) == region;
      });
      if (!allowed) {
        result.reason = fmt::format(
            "Request from region {} not allowed. Allowed regions: {}",
            *context.region, fmt::join(regions, ", "));
        return result;
      }
    }
  }

  auto per_minute = positive_limit(constraints, "rate_limit_per_minute");
  auto per_day = positive_limit(constraints, "rate_limit_per_day");
  auto requests = std::vector<rate_limit_request>{};
  if (per_minute) {
    applied.emplace_back("rate_limit_per_minute");
    requests.push_back(rate_limit_request{
        .key = fmt::format("a2a:{}:{}:minute", authorization_id, action),
        .limit = *per_minute,
        .window = agentid::schema::kMillisecondsPerMinute});
  }
  if (per_day) {
    applied.emplace_back("rate_limit_per_day");
    requests.push_back(rate_limit_request{
        .key = fmt::format("a2a:{}:{}:day", authorization_id, action),
        .limit = *per_day,
        .window = agentid::schema::kMillisecondsPerDay});
  }
  if (!requests.empty()) {
    // Nothing is charged unless every window admits the request.
    auto decisions = limiter_.consume_all(requests);
    if (per_minute && !decisions.front().allowed) {
      result.reason = fmt::format("Rate limit exceeded: {} requests per minute",
                                  *per_minute);
      result.rate_limit_remaining = 0;
      return result;
    }
    if (per_day && !decisions.back().allowed) {
      result.reason = fmt::format(
          "Daily rate limit exceeded: {} requests per day", *per_day);
      result.rate_limit_remaining = 0;
      return result;
    }
    result.rate_limit_remaining = std::ranges::min(
        decisions, {}, &rate_limit_decision::remaining).remaining;
  }

  result.granted = true;
  return result;
}

authorization_decision authorization_checker::check(
    const authorization_query& query) {
  auto now = clock_();
  auto context = query.context;
  if (!context.hour) {
    context.hour = agentid::common::utc_hour(now);
  }
  if (!context.day) {
    context.day = std::string{weekday_name(agentid::common::utc_weekday(now))};
  }

  auto candidates = std::vector<agentid::schema::authorization_grant_t>{};
  for (auto& grant : repository_.list_grants(query.requester_credential_id,
                                             query.grantor_credential_id)) {
    if (grant.status == grant_status_t::approved &&
        (!grant.valid_until || *grant.valid_until > now)) {
      candidates.push_back(std::move(grant));
    }
  }
  if (candidates.empty()) {
    return authorization_decision{.reason = "No valid authorization found"};
  }

  for (const auto& grant : candidates) {
    const auto* permission =
        find_grant_permission(grant.permissions, query.action, query.resource);
    if (permission == nullptr) {
      continue;
    }
    auto merged = grant.constraints.is_object()
                      ? grant.constraints
                      : agentid::schema::json_t::object();
    auto own = permission->find("constraints");
    if (own != permission->end() && own->is_object()) {
      merged.update(*own);
    }
    auto evaluation =
        evaluate_constraints(merged, context, grant.grant_id, query.action);
    if (!evaluation.granted) {
      spdlog::debug("Authorization {} denied {}: {}", grant.grant_id,
                    query.action, evaluation.reason.value_or(""));
      continue;
    }
    return authorization_decision{
        .authorized = true,
        .authorization_id = grant.grant_id,
        .constraints_applied = std::move(evaluation.constraints_applied),
        .valid_until = grant.valid_until,
        .rate_limit_remaining = evaluation.rate_limit_remaining};
  }
  return authorization_decision{
      .reason = "No authorization with valid constraints found"};
}

std::optional<agentid::schema::authorization_grant_t> authorization_checker::get(
    const std::string_view grant_id) const {
  return repository_.get_grant(grant_id);
}

std::vector<agentid::schema::authorization_grant_t> authorization_checker::list(
    const std::string_view credential_id) const {
  auto out = std::vector<agentid::schema::authorization_grant_t>{};
  for (auto& grant : repository_.list_grants()) {
    if (grant.requester_credential_id == credential_id ||
        grant.grantor_credential_id == credential_id) {
      out.push_back(std::move(grant));
    }
  }
  return out;
}

}  // namespace agentid::execution
