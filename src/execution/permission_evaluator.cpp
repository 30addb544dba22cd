#include <agentid/execution/permission_evaluator.hpp>

#include <agentid/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

#include <fmt/format.h>

namespace agentid::execution {

namespace {

constexpr auto kWeekdayNames = std::array<std::string_view, 7>{
    "sunday", "monday", "tuesday", "wednesday",
    "thursday", "friday", "saturday"};

std::vector<std::string> string_array(const agentid::schema::json_t& value) {
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

agentid::schema::json_t object_or_empty(const agentid::schema::json_t& value) {
  if (value.is_object()) {
    return value;
  }
  return agentid::schema::json_t::object();
}

void append_entry(std::vector<normalized_permission>& out,
                  const agentid::schema::json_t& entry) {
  if (entry.is_string()) {
    auto action = entry.get<std::string>();
    if (!action.empty()) {
      out.push_back(normalized_permission{.action = std::move(action)});
    }
    return;
  }
  if (!entry.is_object()) {
    return;
  }
  auto conditions = object_or_empty(entry.value("conditions", agentid::schema::json_t{}));
  auto domains = string_array(entry.value("domains", agentid::schema::json_t{}));

  auto action_it = entry.find("action");
  if (action_it != entry.end() && action_it->is_string()) {
    auto action = action_it->get<std::string>();
    if (action.empty()) {
      return;
    }
    out.push_back(normalized_permission{
        .action = std::move(action),
        .domains = std::move(domains),
        .resources = string_array(entry.value("resources", agentid::schema::json_t{})),
        .conditions = std::move(conditions)});
    return;
  }

  // Policy entry: one resource, several actions.
  auto actions_it = entry.find("actions");
  if (actions_it == entry.end()) {
    return;
  }
  auto resources = std::vector<std::string>{};
  auto resource_it = entry.find("resource");
  if (resource_it != entry.end() && resource_it->is_string()) {
    resources.push_back(resource_it->get<std::string>());
  }
  for (auto& action : string_array(*actions_it)) {
    if (action.empty()) {
      continue;
    }
    out.push_back(normalized_permission{.action = std::move(action),
                                        .domains = domains,
                                        .resources = resources,
                                        .conditions = conditions});
  }
}

std::vector<normalized_permission> normalize_legacy(
    const agentid::schema::json_t& permissions) {
  auto out = std::vector<normalized_permission>{};
  auto domains =
      string_array(permissions.value("domains", agentid::schema::json_t{}));
  auto conditions = agentid::schema::json_t::object();
  auto limits_it = permissions.find("resource_limits");
  if (limits_it != permissions.end() && limits_it->is_object()) {
    static constexpr auto kLimitRenames =
        std::array<std::pair<std::string_view, std::string_view>, 3>{{
            {"max_transaction_value", "max_transaction_amount"},
            {"daily_limit", "daily_spend_limit"},
            {"rate_limit_per_minute", "max_requests_per_minute"},
        }};
    for (const auto& [from, to] : kLimitRenames) {
      auto it = limits_it->find(std::string{from});
      if (it != limits_it->end() && !it->is_null()) {
        conditions[std::string{to}] = *it;
      }
    }
  }
  for (auto& action :
       string_array(permissions.value("actions", agentid::schema::json_t{}))) {
    if (action.empty()) {
      continue;
    }
    out.push_back(normalized_permission{.action = std::move(action),
                                        .domains = domains,
                                        .resources = {},
                                        .conditions = conditions});
  }
  return out;
}

const normalized_permission* find_matching(
    const std::vector<normalized_permission>& permissions,
    const permission_request& request) {
  for (const auto& permission : permissions) {
    if (!action_matches(request.action, permission.action)) {
      continue;
    }
    if (request.resource && !permission.resources.empty()) {
      auto matched = std::ranges::any_of(
          permission.resources, [&](const std::string& pattern) {
            return resource_matches(*request.resource, pattern);
          });
      if (!matched) {
        continue;
      }
    }
    return &permission;
  }
  return nullptr;
}

bool truthy(const agentid::schema::json_t& conditions, const char* name) {
  auto it = conditions.find(name);
  if (it == conditions.end() || it->is_null()) {
    return false;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  if (it->is_number()) {
    return it->get<double>() != 0.0;
  }
  return true;
}


std::optional<std::string> evaluate_conditions(
    const agentid::schema::json_t& conditions,
    const permission_context& context,
    std::vector<std::string>& applied) {
  auto hours_it = conditions.find("valid_hours");
  if (hours_it != conditions.end() && hours_it->is_object()) {
    applied.emplace_back("valid_hours");
    auto hour_bound = [&](const char* name, const int fallback) {
      auto it = hours_it->find(name);
      if (it == hours_it->end()) {
        return fallback;
      }
      if (it->is_number_integer()) {
        return it->get<int>();
      }
      // "HH:MM" as written by policy editors; minutes are ignored.
      if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        auto hour = 0;
        auto [end, ec] =
            std::from_chars(text.data(), text.data() + text.size(), hour);
        if (ec == std::errc{} && end != text.data()) {
          return hour;
        }
      }
      return fallback;
    };
    auto start = hour_bound("start", 0);
    auto end = hour_bound("end", 23);
    if (context.hour) {
      auto hour = static_cast<int>(*context.hour);
      auto outside = start > end ? (hour < start && hour > end)
                                 : (hour < start || hour > end);
      if (outside) {
        return fmt::format("Action not permitted outside hours {}:00-{}:00",
                           start, end);
      }
    }
  }

  auto days = string_array(conditions.value("valid_days", agentid::schema::json_t{}));
  if (!days.empty()) {
    applied.emplace_back("valid_days");
    if (context.day) {
      auto day = *context.day;
      std::ranges::transform(day, day.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
      });
      if (std::ranges::find(days, day) == days.end()) {
        return fmt::format("Action not permitted on {}", day);
      }
    }
  }

  auto regions =
      string_array(conditions.value("allowed_regions", agentid::schema::json_t{}));
  if (!regions.empty()) {
    applied.emplace_back("allowed_regions");
    if (context.region &&
        std::ranges::find(regions, *context.region) == regions.end()) {
      return fmt::format("Action not permitted from region: {}",
                         *context.region);
    }
  }

  for (const auto* noted :
       {"requires_approval", "max_requests_per_minute", "max_requests_per_day",
        "max_transaction_amount", "daily_spend_limit"}) {
    if (truthy(conditions, noted)) {
      applied.emplace_back(noted);
    }
  }
  return std::nullopt;
}

}  // namespace

std::vector<normalized_permission> normalize_permissions(
    const agentid::schema::json_t& permissions) {
  if (permissions.is_array()) {
    auto out = std::vector<normalized_permission>{};
    for (const auto& entry : permissions) {
      append_entry(out, entry);
    }
    return out;
  }
  if (permissions.is_object()) {
    return normalize_legacy(permissions);
  }
  return {};
}

bool action_matches(const std::string_view requested,
                    const std::string_view pattern) {
  if (pattern == requested) {
    return true;
  }
  if (pattern.ends_with(":*")) {
    return requested.starts_with(pattern.substr(0, pattern.size() - 1));
  }
  if (std::ranges::find(kStandardActions, pattern) != kStandardActions.end()) {
    return requested.size() > pattern.size() &&
           requested.starts_with(pattern) && requested[pattern.size()] == ':';
  }
  return false;
}

bool resource_matches(const std::string_view requested,
                      const std::string_view pattern) {
  if (pattern == requested || pattern == "*") {
    return true;
  }
  if (pattern.ends_with("/*")) {
    return requested.starts_with(pattern.substr(0, pattern.size() - 1));
  }
  return false;
}

permission_check_result check_permission(const permission_request& request,
                                         const agentid::schema::json_t& permissions,
                                         const permission_context& context,
                                         rate_limiter* limiter) {
  auto result = permission_check_result{.action = request.action};
  auto normalized = normalize_permissions(permissions);
  const auto* matching = find_matching(normalized, request);
  if (matching == nullptr) {
    result.reason = fmt::format("Action '{}' is not permitted", request.action);
    return result;
  }

  if (auto denied = evaluate_conditions(matching->conditions, context,
                                        result.conditions_applied)) {
    result.reason = std::move(denied);
    return result;
  }

  if (limiter != nullptr && context.credential_id) {
    auto per_minute = positive_limit(matching->conditions, "max_requests_per_minute");
    auto per_day = positive_limit(matching->conditions, "max_requests_per_day");
    if (per_minute || per_day) {
      auto requests = std::vector<rate_limit_request>{};
      if (per_minute) {
        requests.push_back(rate_limit_request{
            .key = fmt::format("perm:{}:{}:minute", *context.credential_id,
                               request.action),
            .limit = *per_minute,
            .window = agentid::schema::kMillisecondsPerMinute});
      }
      if (per_day) {
        requests.push_back(rate_limit_request{
            .key = fmt::format("perm:{}:{}:day", *context.credential_id,
                               request.action),
            .limit = *per_day,
            .window = agentid::schema::kMillisecondsPerDay});
      }
      // Nothing is charged unless every window admits the request.
      auto decisions = limiter->consume_all(requests);
      auto limits = permission_rate_limit{};
      const auto* minute = per_minute ? &decisions.front() : nullptr;
      const auto* day = per_day ? &decisions.back() : nullptr;
      if (minute != nullptr) {
        limits.minute_remaining = minute->remaining;
      }
      if (day != nullptr) {
        limits.day_remaining = day->remaining;
      }
      if (minute != nullptr && !minute->allowed) {
        result.reason = fmt::format(
            "Rate limit exceeded: {} requests per minute", *per_minute);
        result.rate_limit = limits;
        return result;
      }
      if (day != nullptr && !day->allowed) {
        result.reason = fmt::format(
            "Daily rate limit exceeded: {} requests per day", *per_day);
        result.rate_limit = limits;
        return result;
      }
      result.rate_limit = limits;
    }
  }

  result.granted = true;
  return result;
}

std::optional<uint64_t> positive_limit(const agentid::schema::json_t& object,
                                       const std::string_view name) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(name);
  if (it == object.end() || !it->is_number()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<uint64_t>();
    return value >= 1 ? std::optional<uint64_t>{value} : std::nullopt;
  }
  auto value = it->get<double>();
  if (std::isnan(value) || value < 1.0) {
    return std::nullopt;
  }
  // 2^64 as a double; anything at or above it does not fit.
  if (value >= 18446744073709551616.0) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(value);
}

std::string_view weekday_name(const uint32_t weekday) {
  return kWeekdayNames[weekday % kWeekdayNames.size()];
}

agentid::schema::json_t to_json(const permission_check_result& result) {
  auto out = agentid::schema::json_t{{"action", result.action},
                                     {"granted", result.granted}};
  if (result.reason) {
    out["reason"] = *result.reason;
  }
  if (!result.conditions_applied.empty()) {
    out["conditions_applied"] = result.conditions_applied;
  }
  if (result.rate_limit) {
    out["rate_limit"] = {{"minute_remaining", result.rate_limit->minute_remaining},
                         {"day_remaining", result.rate_limit->day_remaining}};
  }
  return out;
}

}  // namespace agentid::execution
