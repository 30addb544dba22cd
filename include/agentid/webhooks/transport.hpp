#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentid::webhooks {

inline constexpr auto kDeliveryTimeout = std::chrono::milliseconds{10000};

struct webhook_request final {
  std::string url;
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds timeout{kDeliveryTimeout};
};

struct webhook_response final {
  // Empty when no HTTP response arrived (connect failure, timeout).
  std::optional<uint32_t> status;
  std::string error;

  bool ok() const { return status && *status >= 200 && *status < 300; }
};

/// Outbound HTTP POST used for webhook delivery. Implementations must honour
/// `request.timeout` and report failures through the response. A thrown
/// exception is recorded as a failed attempt.
class webhook_transport {
 public:
  virtual ~webhook_transport() = default;

  virtual webhook_response send(const webhook_request& request) = 0;
};

}  // namespace agentid::webhooks
