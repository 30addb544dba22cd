#include <agentid/crypto/base64.hpp>
#include <agentid/crypto/verify.hpp>
#include <agentid/execution/verifier.hpp>
#include <agentid/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <regex>
#include <string>
#include <vector>

using namespace agentid::schema;
using agentid::execution::permission_check_request;
using agentid::execution::verify_request;

namespace {

verify_request by_id(const std::string& credential_id) {
  return verify_request{.credential_id = credential_id};
}

verify_request inline_payload(const json_t& payload) {
  return verify_request{.credential = payload};
}

}  // namespace

TEST(verifier, request_ids_are_base36_tagged) {
  auto id = agentid::execution::make_request_id(agentid::testing::kMonday10am);
  EXPECT_TRUE(std::regex_match(id, std::regex{"req_[0-9a-z]+_[0-9a-z]{6}"})) << id;
  EXPECT_NE(id, agentid::execution::make_request_id(agentid::testing::kMonday10am));
}

TEST(verifier, stored_credential_verifies_by_id) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_id"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto issued = fixture.issue(issuer.issuer_id, "agent-1");

  auto response = engine.verify(by_id(issued.record.credential_id));
  ASSERT_TRUE(response.valid) << response.error->message;
  EXPECT_FALSE(response.error);
  ASSERT_TRUE(response.credential);
  EXPECT_EQ(response.credential->agent_id, "agent-1");
  EXPECT_EQ(response.credential->issuer.at("issuer_id"), issuer.issuer_id);
  EXPECT_EQ(response.credential->permissions, json_t::array({"read", "write"}));
  EXPECT_FALSE(response.policy);
  EXPECT_FALSE(response.permission_check);

  auto json = agentid::execution::to_json(response);
  EXPECT_EQ(json.at("valid"), true);
  EXPECT_EQ(json.at("request_id"), response.request_id);
  EXPECT_FALSE(json.contains("error"));
}

TEST(verifier, presented_payload_is_checked_against_the_issuer_key) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_inline"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto issued = fixture.issue(issuer.issuer_id, "agent-1");

  EXPECT_TRUE(engine.verify(inline_payload(issued.payload)).valid);

  auto tampered = issued.payload;
  tampered["permissions"] = json_t::array({"read", "write", "transact"});
  auto response = engine.verify(inline_payload(tampered));
  EXPECT_FALSE(response.valid);
  EXPECT_EQ(response.error->code, verify_error_code::invalid_signature);

  auto unsigned_copy = issued.payload;
  unsigned_copy.erase("signature");
  EXPECT_EQ(engine.verify(inline_payload(unsigned_copy)).error->code,
            verify_error_code::invalid_request);

  auto foreign = issued.payload;
  foreign["issuer"]["issuer_id"] = "unknown-issuer";
  foreign["credential_id"] = "not-stored-here";
  EXPECT_EQ(engine.verify(inline_payload(foreign)).error->code,
            verify_error_code::issuer_not_found);

  EXPECT_EQ(engine.verify(inline_payload(json_t::array())).error->code,
            verify_error_code::invalid_request);
}

TEST(verifier, flipped_signature_byte_is_an_invalid_signature) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_flip"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto issued = fixture.issue(issuer.issuer_id, "agent-1");

  auto raw = agentid::crypto::try_decode_base64(
      issued.payload.at("signature").get<std::string>());
  ASSERT_TRUE(raw);
  (*raw)[10] ^= 0x80;
  auto tampered = issued.payload;
  tampered["signature"] =
      agentid::crypto::encode_base64(make_bytes_view(*raw));

  auto response = engine.verify(inline_payload(tampered));
  EXPECT_FALSE(response.valid);
  EXPECT_EQ(response.error->code, verify_error_code::invalid_signature);
  EXPECT_EQ(agentid::execution::to_json(response).at("error").at("code"),
            "INVALID_SIGNATURE");
}

TEST(verifier, reports_missing_and_unknown_credentials) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_missing"};
  auto& engine = fixture.engine();

  auto missing = engine.verify(verify_request{});
  EXPECT_FALSE(missing.valid);
  EXPECT_EQ(missing.error->code, verify_error_code::missing_input);
  EXPECT_EQ(agentid::execution::to_json(missing).at("error").at("code"),
            "MISSING_INPUT");

  auto unknown = engine.verify(by_id("does-not-exist"));
  EXPECT_EQ(unknown.error->code, verify_error_code::credential_not_found);
  EXPECT_FALSE(unknown.request_id.empty());
}

TEST(verifier, status_and_window_come_from_the_record) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_window"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();

  auto future = fixture.make_issue(issuer.issuer_id, "agent-future", 30);
  future.valid_from = fixture.clock().now() + kMillisecondsPerDay;
  auto pending = engine.issue_credential(future);
  ASSERT_TRUE(pending.ok()) << pending.message;
  EXPECT_EQ(engine.verify(by_id(pending.value.record.credential_id)).error->code,
            verify_error_code::credential_not_yet_valid);

  auto issued = fixture.issue(issuer.issuer_id, "agent-1", 1);
  auto id = issued.record.credential_id;
  fixture.clock().advance(kMillisecondsPerDay);
  // Expiry is exclusive of valid_until.
  EXPECT_EQ(engine.verify(by_id(id)).error->code,
            verify_error_code::credential_expired);
  EXPECT_EQ(engine.verify(inline_payload(issued.payload)).error->code,
            verify_error_code::credential_expired);

  auto live = fixture.issue(issuer.issuer_id, "agent-2");
  ASSERT_TRUE(engine.suspend_credential(issuer.issuer_id, live.record.credential_id).ok());
  auto suspended = engine.verify(by_id(live.record.credential_id));
  EXPECT_EQ(suspended.error->code, verify_error_code::credential_revoked);
  EXPECT_EQ(suspended.error->message, "Credential status: suspended");

  ASSERT_TRUE(engine.reinstate_credential(issuer.issuer_id,
                                          live.record.credential_id).ok());
  ASSERT_TRUE(engine.revoke_credential(issuer.issuer_id,
                                       live.record.credential_id).ok());
  // A presented copy cannot outlive its revocation.
  EXPECT_EQ(engine.verify(inline_payload(live.payload)).error->code,
            verify_error_code::credential_revoked);
}

TEST(verifier, permission_check_is_evaluated_on_success_only) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_permission"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto id = fixture.issue(issuer.issuer_id, "agent-1").record.credential_id;

  auto allowed = engine.verify(verify_request{
      .credential_id = id,
      .check_permission = permission_check_request{.action = "read:orders"}});
  ASSERT_TRUE(allowed.valid);
  ASSERT_TRUE(allowed.permission_check);
  EXPECT_TRUE(allowed.permission_check->granted);

  auto denied = engine.verify(verify_request{
      .credential_id = id,
      .check_permission = permission_check_request{.action = "transact"}});
  ASSERT_TRUE(denied.valid);
  EXPECT_FALSE(denied.permission_check->granted);
  EXPECT_TRUE(denied.permission_check->reason);

  auto unknown = engine.verify(verify_request{
      .credential_id = std::string{"missing"},
      .check_permission = permission_check_request{.action = "read"}});
  EXPECT_FALSE(unknown.permission_check);
}

TEST(verifier, batch_limits_and_order) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_batch"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto id = fixture.issue(issuer.issuer_id, "agent-1").record.credential_id;

  EXPECT_EQ(engine.verify_batch({}).code, operation_error_code::batch_empty);
  EXPECT_EQ(engine.verify_batch(std::vector<verify_request>(101, by_id(id))).code,
            operation_error_code::batch_too_large);

  auto batch = engine.verify_batch({by_id(id), by_id("missing"), verify_request{}});
  ASSERT_TRUE(batch.ok());
  ASSERT_EQ(batch.value.size(), 3u);
  EXPECT_TRUE(batch.value[0].valid);
  EXPECT_EQ(batch.value[1].error->code, verify_error_code::credential_not_found);
  EXPECT_EQ(batch.value[2].error->code, verify_error_code::missing_input);
}

TEST(verifier, every_attempt_is_logged) {
  if (!agentid::crypto::available()) {
    GTEST_SKIP() << "OpenSSL without Ed25519";
  }
  auto fixture = agentid::testing::engine_fixture{"agentid_verify_log"};
  auto& engine = fixture.engine();
  auto issuer = fixture.register_issuer();
  auto id = fixture.issue(issuer.issuer_id, "agent-1").record.credential_id;

  engine.verify(by_id(id));
  engine.verify(by_id("missing"));
  engine.wait_idle();

  auto events = engine.verification_log();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(engine.verification_log(id).size(), 1u);
  auto failed = engine.verification_log(std::string{"missing"});
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_FALSE(failed[0].success);
  EXPECT_EQ(failed[0].error_code,
            std::optional<verify_error_code>{verify_error_code::credential_not_found});

  auto reputation = engine.reputation(id);
  ASSERT_TRUE(reputation);
  EXPECT_EQ(reputation->successful_verifications, 1u);
}
