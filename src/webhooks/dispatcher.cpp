#include <agentid/webhooks/dispatcher.hpp>

#include <agentid/crypto/digest.hpp>
#include <agentid/crypto/random.hpp>
#include <agentid/schema/delivery_status.hpp>

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace agentid::webhooks {

namespace {

constexpr auto kMaxErrorLength = std::size_t{500};

bool subscribed_to(const agentid::schema::webhook_subscription_t& subscription,
                   const std::string_view event) {
  return std::ranges::find(subscription.events, event) !=
         subscription.events.end();
}

}  // namespace

bool is_known_event(const std::string_view event) {
  return std::ranges::find(kWebhookEvents, event) != kWebhookEvents.end();
}

agentid::schema::duration_milliseconds_t backoff_delay(const uint32_t attempt) {
  auto index = attempt == 0 ? std::size_t{0} : std::size_t{attempt - 1};
  index = std::min(index, kBackoffSeconds.size() - 1);
  return kBackoffSeconds[index] * agentid::schema::kMillisecondsPerSecond;
}

std::string sign_payload(const std::string_view payload,
                         const std::string_view secret) {
  return agentid::crypto::hmac_sha256_hex(secret, payload);
}

bool verify_signature(const std::string_view payload,
                      const std::string_view signature,
                      const std::string_view secret) {
  return agentid::crypto::constant_time_equals(sign_payload(payload, secret),
                                               signature);
}

std::string generate_secret() {
  auto bytes = agentid::crypto::random_bytes(32);
  return "whsec_" +
         agentid::schema::to_hex(agentid::schema::make_bytes_view(bytes));
}

dispatcher::dispatcher(agentid::storage::repository& repository,
                       webhook_transport* transport,
                       agentid::common::clock_fn_t clock)
    : repository_{repository}, transport_{transport}, clock_{std::move(clock)} {}

agentid::schema::operation_result<agentid::schema::webhook_subscription_t>
dispatcher::create_subscription(const std::string_view issuer_id,
                                std::string url,
                                std::vector<std::string> events) {
  using result_t =
      agentid::schema::operation_result<agentid::schema::webhook_subscription_t>;
  if (!repository_.get_issuer(issuer_id)) {
    return result_t::failure(agentid::schema::operation_error_code::issuer_not_found,
                             "Issuer not found");
  }
  if (!url.starts_with("https://") && !url.starts_with("http://")) {
    return result_t::failure(agentid::schema::operation_error_code::invalid_request,
                             "Webhook url must be http(s)");
  }
  if (events.empty()) {
    return result_t::failure(agentid::schema::operation_error_code::invalid_request,
                             "At least one event is required");
  }
  for (const auto& event : events) {
    if (!is_known_event(event)) {
      return result_t::failure(
          agentid::schema::operation_error_code::invalid_request,
          fmt::format("Unknown webhook event '{}'", event));
    }
  }

  auto subscription = agentid::schema::webhook_subscription_t{
      .subscription_id = agentid::crypto::make_uuid(),
      .issuer_id = std::string{issuer_id},
      .url = std::move(url),
      .secret = generate_secret(),
      .events = std::move(events),
      .is_active = true,
      .created_at = clock_()};
  repository_.put_subscription(subscription);
  spdlog::info("webhook: subscription {} created for issuer {}",
               subscription.subscription_id, subscription.issuer_id);
  return result_t::success(std::move(subscription));
}

agentid::schema::operation_result<agentid::schema::webhook_subscription_t>
dispatcher::set_subscription_active(const std::string_view issuer_id,
                                    const std::string_view subscription_id,
                                    const bool active) {
  using result_t =
      agentid::schema::operation_result<agentid::schema::webhook_subscription_t>;
  auto lock = std::scoped_lock{mutex_};
  auto subscription = repository_.get_subscription(subscription_id);
  if (!subscription) {
    return result_t::failure(
        agentid::schema::operation_error_code::subscription_not_found,
        "Subscription not found");
  }
  if (subscription->issuer_id != issuer_id) {
    return result_t::failure(agentid::schema::operation_error_code::issuer_mismatch,
                             "Subscription belongs to another issuer");
  }
  subscription->is_active = active;
  if (active) {
    subscription->consecutive_failures = 0;
  }
  repository_.put_subscription(*subscription);
  return result_t::success(std::move(*subscription));
}

std::vector<agentid::schema::webhook_subscription_t> dispatcher::subscriptions(
    const std::string_view issuer_id) const {
  return repository_.list_subscriptions(issuer_id);
}

trigger_summary dispatcher::trigger(const std::string_view issuer_id,
                                    const std::string_view event,
                                    const agentid::schema::json_t& data) {
  auto summary = trigger_summary{};
  auto now = clock_();
  auto payload = agentid::schema::json_t{
      {"event", std::string{event}},
      {"timestamp", agentid::common::format_iso8601(now)},
      {"data", data}};
  auto body = payload.dump();

  for (auto& subscription : repository_.list_subscriptions(issuer_id)) {
    if (!subscription.is_active || !subscribed_to(subscription, event)) {
      continue;
    }
    auto delivery = agentid::schema::webhook_delivery_t{
        .delivery_id = agentid::crypto::make_uuid(),
        .subscription_id = subscription.subscription_id,
        .event = std::string{event},
        .payload = body,
        .status = agentid::schema::delivery_status_t::pending,
        .attempts = 0,
        .created_at = now,
        .updated_at = now};

    if (transport_ == nullptr) {
      repository_.put_delivery(delivery);
      spdlog::debug("webhook: no transport, delivery {} left pending",
                    delivery.delivery_id);
      continue;
    }

    delivery.attempts = 1;
    repository_.put_delivery(delivery);

    auto request = webhook_request{
        .url = subscription.url,
        .body = body,
        .headers = {{"Content-Type", "application/json"},
                    {std::string{kSignatureHeader},
                     sign_payload(body, subscription.secret)},
                    {std::string{kTimestampHeader},
                     std::to_string(now / agentid::schema::kMillisecondsPerSecond)},
                    {std::string{kDeliveryIdHeader}, delivery.delivery_id}},
        .timeout = kDeliveryTimeout};
    auto response = webhook_response{};
    try {
      response = transport_->send(request);
    } catch (const std::exception& e) {
      response = webhook_response{.error = e.what()};
    }

    if (response.ok()) {
      record_success(std::move(subscription), std::move(delivery), response);
      ++summary.triggered;
    } else {
      record_failure(std::move(subscription), std::move(delivery), response);
      ++summary.failed;
    }
  }
  return summary;
}

void dispatcher::record_success(
    agentid::schema::webhook_subscription_t subscription,
    agentid::schema::webhook_delivery_t delivery,
    const webhook_response& response) {
  auto now = clock_();
  delivery.status = agentid::schema::delivery_status_t::delivered;
  delivery.response_status = response.status;
  delivery.updated_at = now;
  repository_.put_delivery(delivery);

  auto lock = std::scoped_lock{mutex_};
  auto current = repository_.get_subscription(subscription.subscription_id)
                     .value_or(std::move(subscription));
  current.consecutive_failures = 0;
  current.last_success_at = now;
  repository_.put_subscription(current);
}

void dispatcher::record_failure(
    agentid::schema::webhook_subscription_t subscription,
    agentid::schema::webhook_delivery_t delivery,
    const webhook_response& response) {
  auto now = clock_();
  delivery.status = agentid::schema::delivery_status_t::retrying;
  delivery.response_status = response.status;
  delivery.error = response.error.substr(
      0, std::min(response.error.size(), kMaxErrorLength));
  delivery.next_retry_at = now + backoff_delay(delivery.attempts);
  delivery.updated_at = now;
  repository_.put_delivery(delivery);

  auto lock = std::scoped_lock{mutex_};
  auto current = repository_.get_subscription(subscription.subscription_id)
                     .value_or(std::move(subscription));
  ++current.consecutive_failures;
  current.last_failure_at = now;
  if (current.consecutive_failures >= kMaxConsecutiveFailures) {
    current.is_active = false;
    spdlog::warn("webhook: subscription {} disabled after {} failures",
                 current.subscription_id, current.consecutive_failures);
  }
  repository_.put_subscription(current);
  spdlog::warn("webhook: delivery {} to {} failed (status {}): {}",
               delivery.delivery_id, current.url,
               response.status ? std::to_string(*response.status) : "none",
               delivery.error);
}

}  // namespace agentid::webhooks
