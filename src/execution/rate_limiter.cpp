#include <agentid/execution/rate_limiter.hpp>

#include <utility>

namespace agentid::execution {

rate_limiter::rate_limiter(agentid::common::clock_fn_t clock)
    : clock_{std::move(clock)} {}

rate_limit_decision rate_limiter::consume(
    const std::string& key,
    const uint64_t limit,
    const agentid::schema::duration_milliseconds_t window) {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto& state = current_window(key, window, now);
  if (state.count >= limit) {
    return rate_limit_decision{
        .allowed = false, .remaining = 0, .reset_at = state.reset_at};
  }
  ++state.count;
  return rate_limit_decision{.allowed = true,
                             .remaining = limit - state.count,
                             .reset_at = state.reset_at};
}

std::vector<rate_limit_decision> rate_limiter::consume_all(
    const std::vector<rate_limit_request>& requests) {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto states = std::vector<window_state*>{};
  states.reserve(requests.size());
  auto admitted = true;
  for (const auto& request : requests) {
    auto& state = current_window(request.key, request.window, now);
    admitted = admitted && state.count < request.limit;
    states.push_back(&state);
  }

  auto out = std::vector<rate_limit_decision>{};
  out.reserve(requests.size());
  for (std::size_t i = 0; i < requests.size(); ++i) {
    auto& state = *states[i];
    auto open = state.count < requests[i].limit;
    if (admitted) {
      ++state.count;
    }
    out.push_back(rate_limit_decision{
        .allowed = open,
        .remaining = open ? requests[i].limit - state.count : 0,
        .reset_at = state.reset_at});
  }
  return out;
}

rate_limiter::window_state& rate_limiter::current_window(
    const std::string& key,
    const agentid::schema::duration_milliseconds_t window,
    const agentid::schema::timestamp_milliseconds_t now) {
  auto& state = windows_[key];
  if (state.reset_at == 0 || now >= state.reset_at) {
    state = window_state{.count = 0, .reset_at = now + window};
  }
  return state;
}

std::size_t rate_limiter::purge_expired() {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  return std::erase_if(windows_, [now](const auto& entry) {
    return now >= entry.second.reset_at;
  });
}

}  // namespace agentid::execution
