#pragma once

#include <agentid/common/time.hpp>
#include <agentid/schema/json.hpp>
#include <agentid/schema/operation_result.hpp>
#include <agentid/schema/webhook_delivery.hpp>
#include <agentid/schema/webhook_subscription.hpp>
#include <agentid/storage/repository.hpp>
#include <agentid/webhooks/transport.hpp>
#include <array>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::webhooks {

inline constexpr auto kSignatureHeader = std::string_view{"X-AgentID-Signature"};
inline constexpr auto kTimestampHeader = std::string_view{"X-AgentID-Timestamp"};
inline constexpr auto kDeliveryIdHeader =
    std::string_view{"X-AgentID-Delivery-ID"};

inline constexpr auto kMaxConsecutiveFailures = uint32_t{5};

/// Seconds to wait before retry n (1-based); later retries reuse the last.
inline constexpr auto kBackoffSeconds =
    std::array<uint64_t, 5>{60, 300, 900, 3600, 14400};

inline constexpr auto kWebhookEvents = std::array<std::string_view, 5>{
    "credential.issued", "credential.revoked", "credential.expired",
    "authorization.requested", "authorization.responded"};

bool is_known_event(std::string_view event);

agentid::schema::duration_milliseconds_t backoff_delay(uint32_t attempt);

/// Lower-case hex HMAC-SHA256 of `payload` keyed by the subscription secret.
std::string sign_payload(std::string_view payload, std::string_view secret);

/// Receiver-side check of the X-AgentID-Signature header.
bool verify_signature(std::string_view payload,
                      std::string_view signature,
                      std::string_view secret);

/// "whsec_" followed by 32 random bytes in hex.
std::string generate_secret();

struct trigger_summary final {
  std::size_t triggered{};
  std::size_t failed{};
};

/// Fans issuer events out to matching subscriptions and keeps the delivery
/// and subscription bookkeeping. Runs on the side-effect dispatcher; it is
/// never on a request's critical path. Without a transport, deliveries are
/// recorded as pending and nothing is sent.
class dispatcher final {
 public:
  dispatcher(agentid::storage::repository& repository,
             webhook_transport* transport,
             agentid::common::clock_fn_t clock);

  agentid::schema::operation_result<agentid::schema::webhook_subscription_t>
  create_subscription(std::string_view issuer_id,
                      std::string url,
                      std::vector<std::string> events);

  agentid::schema::operation_result<agentid::schema::webhook_subscription_t>
  set_subscription_active(std::string_view issuer_id,
                          std::string_view subscription_id,
                          bool active);

  std::vector<agentid::schema::webhook_subscription_t> subscriptions(
      std::string_view issuer_id) const;

  /// Build {event, timestamp, data}, sign it per subscription and deliver to
  /// every active subscription of the issuer listening for `event`.
  trigger_summary trigger(std::string_view issuer_id,
                          std::string_view event,
                          const agentid::schema::json_t& data);

 private:
  void record_success(agentid::schema::webhook_subscription_t subscription,
                      agentid::schema::webhook_delivery_t delivery,
                      const webhook_response& response);
  void record_failure(agentid::schema::webhook_subscription_t subscription,
                      agentid::schema::webhook_delivery_t delivery,
                      const webhook_response& response);

  agentid::storage::repository& repository_;
  webhook_transport* transport_;
  agentid::common::clock_fn_t clock_;
  std::mutex mutex_;
};

}  // namespace agentid::webhooks
