#include <agentid/crypto/verify.hpp>
#include <agentid/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

using namespace agentid::schema;

TEST(credential_lifecycle, issue_signs_and_stores_the_payload) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_issue"};
  auto issuer = fixture.register_issuer();
  auto issued = fixture.issue(issuer.issuer_id, "agent-1");

  EXPECT_FALSE(issued.record.credential_id.empty());
  EXPECT_EQ(issued.record.status, credential_status_t::active);
  EXPECT_EQ(issued.record.key_id, issuer.key_id);
  EXPECT_EQ(issued.record.valid_from, fixture.clock().now());
  EXPECT_EQ(issued.payload.at("signature"), issued.record.signature);
  EXPECT_EQ(issued.payload.at("issuer").at("issuer_id"), issuer.issuer_id);
  EXPECT_EQ(json_t::parse(issued.record.credential_payload), issued.payload);

  auto stored = fixture.engine().get_credential(issued.record.credential_id);
  ASSERT_TRUE(stored);
  EXPECT_EQ(stored->credential_payload, issued.record.credential_payload);
}

TEST(credential_lifecycle, issue_validates_input) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_issue_validation"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();

  auto bad_type = fixture.make_issue(issuer.issuer_id, "agent-1");
  bad_type.agent_type = "robot-overlord";
  EXPECT_EQ(engine.issue_credential(bad_type).code,
            operation_error_code::invalid_request);

  auto backwards = fixture.make_issue(issuer.issuer_id, "agent-1");
  backwards.valid_from = backwards.valid_until;
  EXPECT_EQ(engine.issue_credential(backwards).code,
            operation_error_code::invalid_request);

  auto bad_permissions = fixture.make_issue(issuer.issuer_id, "agent-1");
  bad_permissions.permissions = json_t::array({1, 2});
  EXPECT_EQ(engine.issue_credential(bad_permissions).code,
            operation_error_code::invalid_request);

  auto empty_name = fixture.make_issue(issuer.issuer_id, "agent-1");
  empty_name.agent_name.clear();
  EXPECT_EQ(engine.issue_credential(empty_name).code,
            operation_error_code::invalid_request);

  EXPECT_EQ(engine.issue_credential(fixture.make_issue("nobody", "agent-1")).code,
            operation_error_code::issuer_not_found);

  auto unknown_policy = fixture.make_issue(issuer.issuer_id, "agent-1");
  unknown_policy.policy_id = "missing-policy";
  EXPECT_EQ(engine.issue_credential(unknown_policy).code,
            operation_error_code::policy_not_found);
}

TEST(credential_lifecycle, one_active_credential_per_agent) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_duplicate"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto first = fixture.issue(issuer.issuer_id, "agent-1");

  auto duplicate = engine.issue_credential(fixture.make_issue(issuer.issuer_id, "agent-1"));
  EXPECT_EQ(duplicate.code, operation_error_code::duplicate_active_credential);

  // A second issuer may credential the same agent.
  auto other = fixture.register_issuer("Other Issuer");
  EXPECT_TRUE(engine.issue_credential(fixture.make_issue(other.issuer_id, "agent-1")).ok());

  ASSERT_TRUE(engine.revoke_credential(issuer.issuer_id, first.record.credential_id).ok());
  EXPECT_TRUE(engine.issue_credential(fixture.make_issue(issuer.issuer_id, "agent-1")).ok());
}

TEST(credential_lifecycle, verify_only_engine_cannot_issue) {
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_only", false};
  EXPECT_FALSE(fixture.engine().can_sign());
  auto registered = fixture.engine().register_issuer({.name = "Nope"});
  EXPECT_EQ(registered.code, operation_error_code::signing_unavailable);
  auto issued = fixture.engine().issue_credential(fixture.make_issue("x", "agent-1"));
  EXPECT_EQ(issued.code, operation_error_code::signing_unavailable);
}

TEST(credential_lifecycle, renew_extends_from_the_later_of_expiry_and_now) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_renew"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto issued = fixture.issue(issuer.issuer_id, "agent-1", 10);
  auto id = issued.record.credential_id;

  auto renewed = engine.renew_credential(issuer.issuer_id, id, 30);
  ASSERT_TRUE(renewed.ok()) << renewed.message;
  EXPECT_EQ(renewed.value.credential_id, id);
  EXPECT_EQ(renewed.value.valid_until,
            issued.record.valid_until + 30 * kMillisecondsPerDay);
  EXPECT_NE(renewed.value.signature, issued.record.signature);
  auto payload = json_t::parse(renewed.value.credential_payload);
  EXPECT_EQ(payload.at("signature"), renewed.value.signature);
  EXPECT_EQ(payload.at("constraints").at("valid_until"),
            agentid::common::format_iso8601(renewed.value.valid_until));

  // Long past expiry: extension counts from now.
  fixture.clock().advance(200 * kMillisecondsPerDay);
  auto late = engine.renew_credential(issuer.issuer_id, id, 5);
  ASSERT_TRUE(late.ok());
  EXPECT_EQ(late.value.valid_until, fixture.clock().now() + 5 * kMillisecondsPerDay);

  EXPECT_EQ(engine.renew_credential(issuer.issuer_id, id, 0).code,
            operation_error_code::invalid_extend_days);
  EXPECT_EQ(engine.renew_credential(issuer.issuer_id, id, 366).code,
            operation_error_code::invalid_extend_days);
  EXPECT_EQ(engine.renew_credential("someone-else", id, 5).code,
            operation_error_code::credential_not_found);
}

TEST(credential_lifecycle, renew_reactivates_expired_credentials) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_renew_expired"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto issued = fixture.issue(issuer.issuer_id, "agent-1", 1);

  fixture.clock().advance(2 * kMillisecondsPerDay);
  EXPECT_EQ(engine.sweep().expired_credentials, 1u);
  EXPECT_EQ(engine.get_credential(issued.record.credential_id)->status,
            credential_status_t::expired);

  auto renewed = engine.renew_credential(issuer.issuer_id, issued.record.credential_id);
  ASSERT_TRUE(renewed.ok());
  EXPECT_EQ(renewed.value.status, credential_status_t::active);
  EXPECT_EQ(renewed.value.valid_until, fixture.clock().now() + 90 * kMillisecondsPerDay);
}

TEST(credential_lifecycle, revocation_is_terminal) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_revoke"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto id = fixture.issue(issuer.issuer_id, "agent-1").record.credential_id;

  auto heard = std::vector<std::string>{};
  engine.subscribe_revocations(
      [&](const revocation_event_t& event) { heard.push_back(event.credential_id); });

  auto revoked = engine.revoke_credential(issuer.issuer_id, id, "key leaked");
  ASSERT_TRUE(revoked.ok());
  EXPECT_EQ(revoked.value.reason, "key leaked");
  EXPECT_EQ(heard, std::vector<std::string>{id});

  EXPECT_EQ(engine.revoke_credential(issuer.issuer_id, id).code,
            operation_error_code::already_revoked);
  auto renew = engine.renew_credential(issuer.issuer_id, id);
  EXPECT_EQ(renew.code, operation_error_code::credential_revoked);
  EXPECT_EQ(renew.message, "Cannot renew a revoked credential");
  EXPECT_EQ(engine.reinstate_credential(issuer.issuer_id, id).code,
            operation_error_code::invalid_transition);

  auto stored = engine.get_credential(id);
  EXPECT_EQ(stored->status, credential_status_t::revoked);
  EXPECT_EQ(stored->revocation_reason, std::optional<std::string>{"key leaked"});
  EXPECT_EQ(engine.revocations({}).size(), 1u);
}

TEST(credential_lifecycle, revoke_defaults_reason_and_checks_owner) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_revoke_owner"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto other = fixture.register_issuer("Other");
  auto id = fixture.issue(issuer.issuer_id, "agent-1").record.credential_id;

  EXPECT_EQ(engine.revoke_credential(other.issuer_id, id).code,
            operation_error_code::credential_not_found);
  auto revoked = engine.revoke_credential(issuer.issuer_id, id);
  ASSERT_TRUE(revoked.ok());
  EXPECT_EQ(revoked.value.reason, "Revoked by issuer");
}

TEST(credential_lifecycle, suspend_and_reinstate) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_suspend"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto id = fixture.issue(issuer.issuer_id, "agent-1").record.credential_id;

  ASSERT_TRUE(engine.suspend_credential(issuer.issuer_id, id).ok());
  auto twice = engine.suspend_credential(issuer.issuer_id, id);
  EXPECT_EQ(twice.code, operation_error_code::invalid_transition);
  EXPECT_EQ(twice.message, "Cannot move a suspended credential to suspended");

  // The agent slot is free while suspended.
  auto replacement = fixture.issue(issuer.issuer_id, "agent-1");
  EXPECT_EQ(engine.reinstate_credential(issuer.issuer_id, id).code,
            operation_error_code::duplicate_active_credential);
  ASSERT_TRUE(engine.revoke_credential(issuer.issuer_id,
                                       replacement.record.credential_id).ok());
  auto back = engine.reinstate_credential(issuer.issuer_id, id);
  ASSERT_TRUE(back.ok());
  EXPECT_EQ(back.value.status, credential_status_t::active);
}

TEST(credential_lifecycle, bulk_reports_each_item) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_bulk"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto a = fixture.issue(issuer.issuer_id, "agent-a").record.credential_id;
  auto b = fixture.issue(issuer.issuer_id, "agent-b").record.credential_id;
  ASSERT_TRUE(engine.revoke_credential(issuer.issuer_id, b).ok());

  auto renewed = engine.bulk_credentials(agentid::execution::bulk_request{
      .issuer_id = issuer.issuer_id,
      .action = "renew",
      .credential_ids = {a, b, "missing"},
      .extend_days = 10});
  ASSERT_TRUE(renewed.ok());
  EXPECT_EQ(renewed.value.total, 3u);
  EXPECT_EQ(renewed.value.successful, 1u);
  EXPECT_EQ(renewed.value.failed, 2u);
  EXPECT_TRUE(renewed.value.results[0].success);
  EXPECT_EQ(renewed.value.results[1].error,
            std::optional<std::string>{"Cannot renew revoked credential"});
  EXPECT_EQ(renewed.value.results[2].error,
            std::optional<std::string>{"Credential not found"});

  auto revoked = engine.bulk_credentials(agentid::execution::bulk_request{
      .issuer_id = issuer.issuer_id, .action = "revoke", .credential_ids = {a, b}});
  ASSERT_TRUE(revoked.ok());
  EXPECT_EQ(revoked.value.successful, 1u);
  EXPECT_EQ(revoked.value.results[1].error, std::optional<std::string>{"Already revoked"});
  EXPECT_EQ(engine.revocations({.credential_ids = {a}}).at(0).reason,
            "Bulk revocation");
}

TEST(credential_lifecycle, bulk_rejects_malformed_batches) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_bulk_reject"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();

  EXPECT_EQ(engine.bulk_credentials({.issuer_id = issuer.issuer_id, .action = "revoke"}).code,
            operation_error_code::batch_empty);
  auto many = std::vector<std::string>(101, "id");
  EXPECT_EQ(engine.bulk_credentials({.issuer_id = issuer.issuer_id,
                                     .action = "revoke",
                                     .credential_ids = many})
                .code,
            operation_error_code::batch_too_large);
  auto unknown = engine.bulk_credentials(
      {.issuer_id = issuer.issuer_id, .action = "delete", .credential_ids = {"x"}});
  EXPECT_EQ(unknown.code, operation_error_code::invalid_request);
  EXPECT_EQ(unknown.message, "Unknown action: delete. Supported: revoke, renew");
  EXPECT_EQ(engine.bulk_credentials({.issuer_id = issuer.issuer_id,
                                     .action = "renew",
                                     .credential_ids = {"x"},
                                     .extend_days = 400})
                .code,
            operation_error_code::invalid_extend_days);
}

TEST(credential_lifecycle, issue_and_revoke_are_audited) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_audit"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto id = fixture.issue(issuer.issuer_id, "agent-1").record.credential_id;
  ASSERT_TRUE(engine.revoke_credential(issuer.issuer_id, id).ok());
  engine.wait_idle();

  auto actions = std::vector<std::string>{};
  for (const auto& entry : engine.audit_log(issuer.issuer_id)) {
    actions.push_back(entry.action);
  }
  EXPECT_NE(std::ranges::find(actions, "credential.issued"), actions.end());
  EXPECT_NE(std::ranges::find(actions, "credential.revoked"), actions.end());
}
