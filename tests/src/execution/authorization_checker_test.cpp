#include <agentid/crypto/verify.hpp>
#include <agentid/execution/authorization_checker.hpp>
#include <agentid/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace agentid::schema;
using agentid::execution::authorization_context;
using agentid::execution::authorization_query;
using agentid::execution::grant_request;

TEST(authorization_checker, time_windows) {
  using agentid::execution::within_time_window;
  EXPECT_TRUE(within_time_window(9, "9:00-17:00"));
  EXPECT_TRUE(within_time_window(16, "09:00-17:00"));
  EXPECT_FALSE(within_time_window(17, "09:00-17:00"));
  EXPECT_FALSE(within_time_window(8, "09:00-17:00"));

  // Overnight.
  EXPECT_TRUE(within_time_window(23, "22:00-06:00"));
  EXPECT_TRUE(within_time_window(2, "22:00-06:00"));
  EXPECT_FALSE(within_time_window(12, "22:00-06:00"));

  EXPECT_TRUE(within_time_window(3, "whenever"));
  EXPECT_TRUE(within_time_window(3, "9-17"));
  EXPECT_TRUE(within_time_window(3, "09:00-17:00 UTC"));
}

TEST(authorization_checker, grant_action_patterns) {
  using agentid::execution::grant_action_matches;
  EXPECT_TRUE(grant_action_matches("*", "anything"));
  EXPECT_TRUE(grant_action_matches("data.read", "data.read"));
  EXPECT_TRUE(grant_action_matches("data.*", "data.write"));
  EXPECT_FALSE(grant_action_matches("data.*", "database.write"));
  EXPECT_FALSE(grant_action_matches("data.read", "data.write"));
}

namespace {

struct grant_parties final {
  issuer_record_t requester_issuer;
  issuer_record_t grantor_issuer;
  std::string requester;
  std::string grantor;
};

grant_parties make_parties(agentid::testing::engine_fixture& fixture) {
  auto requester_issuer = fixture.register_issuer("Requester Co");
  auto grantor_issuer = fixture.register_issuer("Grantor Co");
  auto requester =
      fixture.issue(requester_issuer.issuer_id, "agent-r").record.credential_id;
  auto grantor =
      fixture.issue(grantor_issuer.issuer_id, "agent-g").record.credential_id;
  return grant_parties{.requester_issuer = std::move(requester_issuer),
                       .grantor_issuer = std::move(grantor_issuer),
                       .requester = std::move(requester),
                       .grantor = std::move(grantor)};
}

grant_request make_grant(const grant_parties& parties,
                         json_t permissions,
                         json_t constraints = json_t::object()) {
  return grant_request{.issuer_id = parties.requester_issuer.issuer_id,
                       .requester_credential_id = parties.requester,
                       .grantor_credential_id = parties.grantor,
                       .permissions = std::move(permissions),
                       .constraints = std::move(constraints),
                       .message = "please"};
}

authorization_query make_query(const grant_parties& parties,
                               std::string action,
                               authorization_context context = {}) {
  return authorization_query{.requester_credential_id = parties.requester,
                             .grantor_credential_id = parties.grantor,
                             .action = std::move(action),
                             .context = std::move(context)};
}

}  // namespace

TEST(authorization_checker, request_respond_check) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_grant_flow"};
  auto& engine = fixture.engine();
  auto parties = make_parties(fixture);

  auto grant = engine.request_authorization(
      make_grant(parties, json_t::parse(R"([{"action":"data.*"}])")));
  ASSERT_TRUE(grant.ok()) << grant.message;
  EXPECT_EQ(grant.value.status, grant_status_t::pending);

  auto pending = engine.check_authorization(make_query(parties, "data.read"));
  EXPECT_FALSE(pending.authorized);
  EXPECT_EQ(pending.reason, std::optional<std::string>{"No valid authorization found"});

  // Only the grantor's issuer may answer.
  EXPECT_EQ(engine.respond_authorization(parties.requester_issuer.issuer_id,
                                         grant.value.grant_id, true)
                .code,
            operation_error_code::issuer_mismatch);
  auto approved = engine.respond_authorization(parties.grantor_issuer.issuer_id,
                                               grant.value.grant_id, true);
  ASSERT_TRUE(approved.ok());
  EXPECT_EQ(approved.value.status, grant_status_t::approved);
  EXPECT_TRUE(approved.value.responded_at);
  EXPECT_EQ(engine.respond_authorization(parties.grantor_issuer.issuer_id,
                                         grant.value.grant_id, false)
                .code,
            operation_error_code::invalid_transition);

  auto allowed = engine.check_authorization(make_query(parties, "data.read"));
  EXPECT_TRUE(allowed.authorized);
  EXPECT_EQ(allowed.authorization_id, std::optional<std::string>{grant.value.grant_id});
  EXPECT_FALSE(engine.check_authorization(make_query(parties, "payments.send")).authorized);

  EXPECT_EQ(engine.list_authorizations(parties.grantor).size(), 1u);
  EXPECT_EQ(engine.list_authorizations(parties.requester).size(), 1u);
}

TEST(authorization_checker, request_validation) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_grant_validation"};
  auto& engine = fixture.engine();
  auto parties = make_parties(fixture);

  EXPECT_EQ(engine.request_authorization(make_grant(parties, json_t::array())).code,
            operation_error_code::invalid_request);
  EXPECT_EQ(engine.request_authorization(make_grant(parties, json_t::array({"read"}))).code,
            operation_error_code::invalid_request);

  auto not_owned = make_grant(parties, json_t::parse(R"([{"action":"x"}])"));
  not_owned.issuer_id = parties.grantor_issuer.issuer_id;
  EXPECT_EQ(engine.request_authorization(not_owned).code,
            operation_error_code::issuer_mismatch);

  auto no_grantor = make_grant(parties, json_t::parse(R"([{"action":"x"}])"));
  no_grantor.grantor_credential_id = "missing";
  EXPECT_EQ(engine.request_authorization(no_grantor).code,
            operation_error_code::credential_not_found);

  ASSERT_TRUE(engine.suspend_credential(parties.grantor_issuer.issuer_id,
                                        parties.grantor).ok());
  auto inactive = engine.request_authorization(
      make_grant(parties, json_t::parse(R"([{"action":"x"}])")));
  EXPECT_EQ(inactive.code, operation_error_code::invalid_request);
  EXPECT_EQ(inactive.message, "Grantor credential is not active");
}

TEST(authorization_checker, constraints_gate_each_check) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_grant_constraints"};
  auto& engine = fixture.engine();
  auto parties = make_parties(fixture);

  auto grant = engine.request_authorization(make_grant(
      parties,
      json_t::parse(R"([{"action":"orders.read","constraints":{"rate_limit_per_minute":2}}])"),
      json_t::parse(R"({"time_window":"09:00-17:00",
                        "allowed_days":["Monday","Tuesday"],
                        "allowed_regions":["us","ca"]})")));
  ASSERT_TRUE(grant.ok());
  ASSERT_TRUE(engine.respond_authorization(parties.grantor_issuer.issuer_id,
                                           grant.value.grant_id, true).ok());

  // Clock sits at Monday 10:00 UTC.
  auto first = engine.check_authorization(
      make_query(parties, "orders.read", {.region = "US"}));
  ASSERT_TRUE(first.authorized) << first.reason.value_or("");
  EXPECT_EQ(first.rate_limit_remaining, std::optional<uint64_t>{1});
  EXPECT_EQ(first.constraints_applied,
            (std::vector<std::string>{"time_window", "allowed_days",
                                      "allowed_regions", "rate_limit_per_minute"}));

  EXPECT_FALSE(engine.check_authorization(
                         make_query(parties, "orders.read", {.region = "FR"}))
                   .authorized);
  EXPECT_FALSE(engine.check_authorization(
                         make_query(parties, "orders.read", {.hour = 20}))
                   .authorized);
  EXPECT_FALSE(engine.check_authorization(
                         make_query(parties, "orders.read", {.day = "sunday"}))
                   .authorized);

  EXPECT_TRUE(engine.check_authorization(make_query(parties, "orders.read")).authorized);
  auto limited = engine.check_authorization(make_query(parties, "orders.read"));
  EXPECT_FALSE(limited.authorized);
  EXPECT_EQ(limited.reason,
            std::optional<std::string>{"No authorization with valid constraints found"});

  fixture.clock().advance(kMillisecondsPerMinute);
  EXPECT_TRUE(engine.check_authorization(make_query(parties, "orders.read")).authorized);
}

TEST(authorization_checker, revoke_and_expiry) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_grant_revoke"};
  auto& engine = fixture.engine();
  auto parties = make_parties(fixture);
  auto permissions = json_t::parse(R"([{"action":"*"}])");

  auto pending = engine.request_authorization(make_grant(parties, permissions));
  ASSERT_TRUE(pending.ok());
  EXPECT_EQ(engine.revoke_authorization(parties.grantor_issuer.issuer_id,
                                        pending.value.grant_id)
                .code,
            operation_error_code::invalid_transition);
  ASSERT_TRUE(engine.respond_authorization(parties.grantor_issuer.issuer_id,
                                           pending.value.grant_id, true).ok());
  auto revoked = engine.revoke_authorization(parties.grantor_issuer.issuer_id,
                                             pending.value.grant_id);
  ASSERT_TRUE(revoked.ok());
  EXPECT_EQ(revoked.value.status, grant_status_t::revoked);
  EXPECT_FALSE(engine.check_authorization(make_query(parties, "x")).authorized);
  EXPECT_EQ(engine.revoke_authorization(parties.grantor_issuer.issuer_id, "nope").code,
            operation_error_code::grant_not_found);

  auto expiring = make_grant(parties, permissions);
  expiring.valid_until = fixture.clock().now() + kMillisecondsPerHour;
  auto timed = engine.request_authorization(expiring);
  ASSERT_TRUE(timed.ok());
  ASSERT_TRUE(engine.respond_authorization(parties.grantor_issuer.issuer_id,
                                           timed.value.grant_id, true).ok());
  EXPECT_TRUE(engine.check_authorization(make_query(parties, "x")).authorized);

  fixture.clock().advance(kMillisecondsPerHour);
  EXPECT_FALSE(engine.check_authorization(make_query(parties, "x")).authorized);
  auto summary = engine.sweep();
  EXPECT_EQ(summary.expired_grants, std::vector<std::string>{timed.value.grant_id});
}

TEST(authorization_checker, oversized_and_stacked_rate_limits) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_grant_limits"};
  auto& engine = fixture.engine();
  auto parties = make_parties(fixture);

  auto huge = engine.request_authorization(make_grant(
      parties, json_t::parse(R"([{"action":"bulk.*","constraints":{"rate_limit_per_minute":1e300}}])")));
  ASSERT_TRUE(huge.ok()) << huge.message;
  ASSERT_TRUE(engine.respond_authorization(parties.grantor_issuer.issuer_id,
                                           huge.value.grant_id, true).ok());
  auto unbounded = engine.check_authorization(make_query(parties, "bulk.export"));
  ASSERT_TRUE(unbounded.authorized) << unbounded.reason.value_or("");
  EXPECT_EQ(unbounded.rate_limit_remaining,
            std::optional<uint64_t>{std::numeric_limits<uint64_t>::max() - 1});

  auto stacked = engine.request_authorization(make_grant(
      parties, json_t::parse(R"([{"action":"orders.read","constraints":{
          "rate_limit_per_minute":2,"rate_limit_per_day":1}}])")));
  ASSERT_TRUE(stacked.ok());
  ASSERT_TRUE(engine.respond_authorization(parties.grantor_issuer.issuer_id,
                                           stacked.value.grant_id, true).ok());
  auto first = engine.check_authorization(make_query(parties, "orders.read"));
  ASSERT_TRUE(first.authorized);
  EXPECT_EQ(first.rate_limit_remaining, std::optional<uint64_t>{0});
  EXPECT_EQ(first.constraints_applied,
            (std::vector<std::string>{"rate_limit_per_minute", "rate_limit_per_day"}));
  EXPECT_FALSE(engine.check_authorization(make_query(parties, "orders.read")).authorized);
}
