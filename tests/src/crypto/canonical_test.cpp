#include <agentid/crypto/base64.hpp>
#include <agentid/crypto/canonical.hpp>
#include <agentid/crypto/digest.hpp>
#include <gtest/gtest.h>

using agentid::schema::json_t;

TEST(canonical, sorts_keys_at_every_depth) {
  auto value = json_t::parse(R"({"b":1,"a":{"z":true,"m":[{"y":1,"x":2}]}})");
  EXPECT_EQ(agentid::crypto::canonicalize(value),
            R"({"a":{"m":[{"x":2,"y":1}],"z":true},"b":1})");
}

TEST(canonical, integral_floats_print_as_integers) {
  auto value = json_t{{"n", 5.0}, {"f", 1.5}};
  EXPECT_EQ(agentid::crypto::canonicalize(value), R"({"f":1.5,"n":5})");
}

TEST(canonical, insertion_order_does_not_matter) {
  auto lhs = json_t::object();
  lhs["agent_id"] = "a-1";
  lhs["permissions"] = json_t::array({"read"});
  auto rhs = json_t::object();
  rhs["permissions"] = json_t::array({"read"});
  rhs["agent_id"] = "a-1";
  EXPECT_EQ(agentid::crypto::canonicalize(lhs),
            agentid::crypto::canonicalize(rhs));
}

TEST(canonical, signing_input_excludes_signature) {
  auto payload = json_t{{"credential_id", "c-1"}, {"signature", "abc"}};
  EXPECT_EQ(agentid::crypto::canonical_signing_input(payload),
            R"({"credential_id":"c-1"})");
}

TEST(canonical, escapes_strings_like_json) {
  auto value = json_t{{"name", "quote\" and \\ slash"}};
  EXPECT_EQ(agentid::crypto::canonicalize(value),
            R"({"name":"quote\" and \\ slash"})");
}

TEST(base64, encodes_and_rejects_malformed_input) {
  auto text = std::string{"agentid"};
  auto encoded = agentid::crypto::encode_base64(
      agentid::schema::make_bytes_view(text));
  EXPECT_EQ(encoded, "YWdlbnRpZA==");
  auto decoded = agentid::crypto::try_decode_base64(encoded);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(agentid::schema::make_string(agentid::schema::make_bytes_view(*decoded)),
            text);
  EXPECT_FALSE(agentid::crypto::try_decode_base64("YWdlbnRpZA"));
  EXPECT_FALSE(agentid::crypto::try_decode_base64("YW*lbnRpZA=="));
}

TEST(digest, hmac_matches_rfc4231_case_two) {
  EXPECT_EQ(agentid::crypto::hmac_sha256_hex("Jefe",
                                             "what do ya want for nothing?"),
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
  EXPECT_TRUE(agentid::crypto::constant_time_equals("abc", "abc"));
  EXPECT_FALSE(agentid::crypto::constant_time_equals("abc", "abd"));
  EXPECT_FALSE(agentid::crypto::constant_time_equals("abc", "abcd"));
}
