#include <agentid/crypto/verify.hpp>
#include <agentid/schema/delivery_status.hpp>
#include <agentid/storage/repository.hpp>
#include <agentid/storage/rocksdb/storage.hpp>
#include <agentid/testing/common.hpp>
#include <agentid/testing/engine_fixture.hpp>
#include <agentid/webhooks/dispatcher.hpp>
#include <agentid/webhooks/transport.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace agentid::schema;
using agentid::webhooks::webhook_request;
using agentid::webhooks::webhook_response;

namespace {

class recording_transport final : public agentid::webhooks::webhook_transport {
 public:
  webhook_response send(const webhook_request& request) override {
    requests.push_back(request);
    if (status) {
      return webhook_response{.status = status};
    }
    return webhook_response{.error = "connection refused"};
  }

  std::optional<uint32_t> status{200};
  std::vector<webhook_request> requests;
};

std::string header(const webhook_request& request, const std::string_view name) {
  for (const auto& [key, value] : request.headers) {
    if (key == name) {
      return value;
    }
  }
  return {};
}

class dispatcher_harness final {
 public:
  explicit dispatcher_harness(agentid::webhooks::webhook_transport* transport)
      : db_path_{agentid::testing::make_db_path("agentid_webhooks")},
        storage_{agentid::storage::make_storage<
            agentid::storage::rocksdb_storage_tag>(db_path_)},
        repository_{storage_},
        dispatcher_{repository_, transport, clock_.fn()} {
    repository_.put_issuer(issuer_record_t{.issuer_id = "issuer-1",
                                           .name = "Acme",
                                           .public_key = "pk",
                                           .key_id = "key_0"});
  }
  ~dispatcher_harness() { agentid::testing::remove_path(db_path_); }

  agentid::testing::manual_clock& clock() { return clock_; }
  agentid::storage::repository& repository() { return repository_; }
  agentid::webhooks::dispatcher& dispatcher() { return dispatcher_; }

  webhook_subscription_t subscribe(std::vector<std::string> events = {
                                       "credential.revoked"}) {
    auto created = dispatcher_.create_subscription(
        "issuer-1", "https://hooks.example.com/agentid", std::move(events));
    EXPECT_TRUE(created.ok()) << created.message;
    return created.value;
  }

 private:
  std::string db_path_;
  agentid::testing::manual_clock clock_;
  agentid::storage::rocksdb_storage_t storage_;
  agentid::storage::repository repository_;
  agentid::webhooks::dispatcher dispatcher_;
};

}  // namespace

TEST(webhooks, backoff_schedule) {
  using agentid::webhooks::backoff_delay;
  EXPECT_EQ(backoff_delay(1), 60 * kMillisecondsPerSecond);
  EXPECT_EQ(backoff_delay(2), 300 * kMillisecondsPerSecond);
  EXPECT_EQ(backoff_delay(5), 14400 * kMillisecondsPerSecond);
  EXPECT_EQ(backoff_delay(9), 14400 * kMillisecondsPerSecond);
}

TEST(webhooks, signatures) {
  auto secret = agentid::webhooks::generate_secret();
  EXPECT_TRUE(secret.starts_with("whsec_"));
  EXPECT_EQ(secret.size(), 6u + 64u);

  auto body = std::string{R"({"event":"credential.revoked"})"};
  auto signature = agentid::webhooks::sign_payload(body, secret);
  EXPECT_EQ(signature.size(), 64u);
  EXPECT_TRUE(agentid::webhooks::verify_signature(body, signature, secret));
  EXPECT_FALSE(agentid::webhooks::verify_signature(body + " ", signature, secret));
  EXPECT_FALSE(agentid::webhooks::verify_signature(body, signature, "whsec_other"));
}

TEST(webhooks, subscription_validation) {
  auto harness = dispatcher_harness{nullptr};
  auto& dispatcher = harness.dispatcher();

  EXPECT_EQ(dispatcher.create_subscription("nobody", "https://x", {"credential.issued"}).code,
            operation_error_code::issuer_not_found);
  EXPECT_EQ(dispatcher.create_subscription("issuer-1", "ftp://x", {"credential.issued"}).code,
            operation_error_code::invalid_request);
  EXPECT_EQ(dispatcher.create_subscription("issuer-1", "https://x", {}).code,
            operation_error_code::invalid_request);
  EXPECT_EQ(dispatcher.create_subscription("issuer-1", "https://x", {"credential.eaten"}).code,
            operation_error_code::invalid_request);

  auto subscription = harness.subscribe();
  EXPECT_TRUE(subscription.is_active);
  EXPECT_EQ(dispatcher.subscriptions("issuer-1").size(), 1u);
  EXPECT_EQ(dispatcher.set_subscription_active("issuer-2", subscription.subscription_id,
                                               false)
                .code,
            operation_error_code::issuer_mismatch);
  EXPECT_EQ(dispatcher.set_subscription_active("issuer-1", "missing", false).code,
            operation_error_code::subscription_not_found);
}

TEST(webhooks, without_transport_deliveries_stay_pending) {
  auto harness = dispatcher_harness{nullptr};
  harness.subscribe();

  auto summary = harness.dispatcher().trigger("issuer-1", "credential.revoked",
                                              json_t{{"credential_id", "c-1"}});
  EXPECT_EQ(summary.triggered, 0u);
  EXPECT_EQ(summary.failed, 0u);
  auto deliveries = harness.repository().list_deliveries();
  ASSERT_EQ(deliveries.size(), 1u);
  EXPECT_EQ(deliveries[0].status, delivery_status_t::pending);
  EXPECT_EQ(deliveries[0].attempts, 0u);
  EXPECT_EQ(json_t::parse(deliveries[0].payload).at("data").at("credential_id"), "c-1");
}

TEST(webhooks, delivery_is_signed_and_filtered_by_event) {
  auto transport = recording_transport{};
  auto harness = dispatcher_harness{&transport};
  auto subscription = harness.subscribe();
  harness.subscribe({"credential.issued"});

  auto summary = harness.dispatcher().trigger("issuer-1", "credential.revoked",
                                              json_t{{"credential_id", "c-1"}});
  EXPECT_EQ(summary.triggered, 1u);
  ASSERT_EQ(transport.requests.size(), 1u);
  const auto& request = transport.requests[0];
  EXPECT_EQ(request.url, "https://hooks.example.com/agentid");
  EXPECT_TRUE(agentid::webhooks::verify_signature(
      request.body, header(request, "X-AgentID-Signature"), subscription.secret));
  EXPECT_EQ(header(request, "X-AgentID-Timestamp"),
            std::to_string(agentid::testing::kMonday10am / 1000));
  EXPECT_FALSE(header(request, "X-AgentID-Delivery-ID").empty());

  auto body = json_t::parse(request.body);
  EXPECT_EQ(body.at("event"), "credential.revoked");
  EXPECT_EQ(body.at("timestamp"), "2025-01-06T10:00:00.000Z");

  auto delivery = harness.repository().get_delivery(header(request, "X-AgentID-Delivery-ID"));
  ASSERT_TRUE(delivery);
  EXPECT_EQ(delivery->status, delivery_status_t::delivered);
  EXPECT_EQ(delivery->response_status, std::optional<uint32_t>{200});

  // Another issuer's events never reach this subscription.
  harness.dispatcher().trigger("issuer-2", "credential.revoked", json_t::object());
  EXPECT_EQ(transport.requests.size(), 1u);
}

TEST(webhooks, failures_back_off_then_disable) {
  auto transport = recording_transport{};
  transport.status = 503;
  auto harness = dispatcher_harness{&transport};
  auto subscription = harness.subscribe();
  auto& dispatcher = harness.dispatcher();

  auto first = dispatcher.trigger("issuer-1", "credential.revoked", json_t::object());
  EXPECT_EQ(first.failed, 1u);
  auto deliveries = harness.repository().list_deliveries();
  ASSERT_EQ(deliveries.size(), 1u);
  EXPECT_EQ(deliveries[0].status, delivery_status_t::retrying);
  EXPECT_EQ(deliveries[0].next_retry_at,
            std::optional<uint64_t>{agentid::testing::kMonday10am + 60 * kMillisecondsPerSecond});

  transport.status.reset();
  for (auto i = 0; i < 4; ++i) {
    dispatcher.trigger("issuer-1", "credential.revoked", json_t::object());
  }
  auto disabled = harness.repository().get_subscription(subscription.subscription_id);
  ASSERT_TRUE(disabled);
  EXPECT_FALSE(disabled->is_active);
  EXPECT_EQ(disabled->consecutive_failures, 5u);
  EXPECT_TRUE(disabled->last_failure_at);

  dispatcher.trigger("issuer-1", "credential.revoked", json_t::object());
  EXPECT_EQ(transport.requests.size(), 5u);

  // Re-enabling clears the failure streak; one success keeps it clear.
  ASSERT_TRUE(dispatcher.set_subscription_active("issuer-1", subscription.subscription_id,
                                                 true)
                  .ok());
  transport.status = 204;
  EXPECT_EQ(dispatcher.trigger("issuer-1", "credential.revoked", json_t::object()).triggered,
            1u);
  auto healthy = harness.repository().get_subscription(subscription.subscription_id);
  EXPECT_EQ(healthy->consecutive_failures, 0u);
  EXPECT_TRUE(healthy->last_success_at);
}

namespace {

class throwing_transport final : public agentid::webhooks::webhook_transport {
 public:
  webhook_response send(const webhook_request& request) override {
    if (request.url == "https://broken.example.com") {
      throw std::runtime_error{"socket closed"};
    }
    delivered.push_back(request.url);
    return webhook_response{.status = 200};
  }

  std::vector<std::string> delivered;
};

}  // namespace

TEST(webhooks, throwing_transport_fails_only_its_subscriber) {
  auto transport = throwing_transport{};
  auto harness = dispatcher_harness{&transport};
  auto& dispatcher = harness.dispatcher();
  auto broken = dispatcher.create_subscription("issuer-1", "https://broken.example.com",
                                               {"credential.revoked"});
  auto healthy = dispatcher.create_subscription("issuer-1", "https://ok.example.com",
                                                {"credential.revoked"});
  ASSERT_TRUE(broken.ok());
  ASSERT_TRUE(healthy.ok());

  auto summary = dispatcher.trigger("issuer-1", "credential.revoked", json_t::object());
  EXPECT_EQ(summary.triggered, 1u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(transport.delivered, std::vector<std::string>{"https://ok.example.com"});

  auto deliveries = harness.repository().list_deliveries();
  ASSERT_EQ(deliveries.size(), 2u);
  for (const auto& delivery : deliveries) {
    if (delivery.subscription_id == broken.value.subscription_id) {
      EXPECT_EQ(delivery.status, delivery_status_t::retrying);
      EXPECT_EQ(delivery.error, "socket closed");
      EXPECT_FALSE(delivery.response_status);
    } else {
      EXPECT_EQ(delivery.status, delivery_status_t::delivered);
    }
  }
  EXPECT_EQ(harness.repository()
                .get_subscription(broken.value.subscription_id)
                ->consecutive_failures,
            1u);
}

TEST(webhooks, engine_events_reach_subscribers) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto transport = recording_transport{};
  auto fixture = agentid::testing::engine_fixture{"agentid_webhook_engine", true, &transport};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  ASSERT_TRUE(engine.create_webhook(issuer.issuer_id, "https://hooks.example.com",
                                    {"credential.issued", "credential.revoked"})
                  .ok());
  auto id = fixture.issue(issuer.issuer_id, "agent-1").record.credential_id;
  ASSERT_TRUE(engine.revoke_credential(issuer.issuer_id, id).ok());
  engine.wait_idle();

  ASSERT_EQ(transport.requests.size(), 2u);
  EXPECT_EQ(json_t::parse(transport.requests[0].body).at("event"), "credential.issued");
  auto revoked = json_t::parse(transport.requests[1].body);
  EXPECT_EQ(revoked.at("event"), "credential.revoked");
  EXPECT_EQ(revoked.at("data").at("credential_id"), id);
}
