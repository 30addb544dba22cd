#pragma once
#include <algorithm>
#include <array>
#include <string_view>

// Schema type: agent type.
// Agent types stay an open string on the wire. Issuance accepts the union of
// the dashboard set (autonomous, supervised, hybrid) and the SDK set
// (autonomous, assistant, bot, service, other).
namespace agentid::schema {

inline constexpr auto kKnownAgentTypes = std::array<std::string_view, 7>{
    "autonomous", "supervised", "hybrid", "assistant",
    "bot",        "service",    "other"};

inline bool is_known_agent_type(const std::string_view value) {
  return std::ranges::find(kKnownAgentTypes, value) !=
         std::end(kKnownAgentTypes);
}

}  // namespace agentid::schema
